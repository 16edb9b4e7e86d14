#include "sandbox.h"

#include <unistd.h>
#include <sys/mount.h>
#include <cstring>
#include <filesystem>

namespace {

using Int = long;

class Writer {
  std::vector<uint8_t>& buf_;
 public:
  explicit Writer(std::vector<uint8_t>& buf) : buf_(buf) {}
  void PushInt(Int val) {
    size_t cur = buf_.size();
    buf_.resize(cur + sizeof(Int));
    memcpy(buf_.data() + cur, &val, sizeof(Int));
  }
  void PushString(const std::string& str) {
    PushInt(str.size());
    buf_.insert(buf_.end(), str.begin(), str.end());
  }
  void PushStrings(const std::vector<std::string>& vec) {
    PushInt(vec.size());
    for (auto& i : vec) PushString(i);
  }
};

class Reader {
  const std::vector<uint8_t>& buf_;
  size_t cur_;
  bool ok_;
 public:
  explicit Reader(const std::vector<uint8_t>& buf) : buf_(buf), cur_(0), ok_(true) {}
  bool Ok() const { return ok_ && cur_ == buf_.size(); }
  Int ReadInt() {
    Int ret = 0;
    if (!ok_ || buf_.size() - cur_ < sizeof(Int)) {
      ok_ = false;
      return 0;
    }
    memcpy(&ret, buf_.data() + cur_, sizeof(Int));
    cur_ += sizeof(Int);
    return ret;
  }
  std::string ReadString() {
    Int size = ReadInt();
    if (!ok_ || size < 0 || (size_t)size > buf_.size() - cur_) {
      ok_ = false;
      return "";
    }
    std::string ret((const char*)buf_.data() + cur_, size);
    cur_ += size;
    return ret;
  }
  std::vector<std::string> ReadStrings() {
    std::vector<std::string> ret;
    Int size = ReadInt();
    for (Int i = 0; ok_ && i < size; i++) ret.push_back(ReadString());
    return ret;
  }
};

} // namespace

void SandboxOptions::FilterDirs(std::vector<std::string>& links) {
  std::vector<std::string> kept;
  for (auto& i : dirs) {
    std::error_code ec;
    auto status = std::filesystem::symlink_status(i, ec);
    if (ec || !std::filesystem::exists(status)) continue;
    if (std::filesystem::is_symlink(status)) {
      links.push_back(i);
    } else if (std::filesystem::is_directory(status)) {
      kept.push_back(i);
    }
  }
  dirs.swap(kept);
}

std::vector<uint8_t> SandboxOptions::Serialize() const {
  std::vector<uint8_t> ret;
  Writer writer(ret);
  writer.PushString(boxdir);
  writer.PushStrings(command);
  writer.PushStrings(envs);
  writer.PushString(workdir);
  writer.PushString(output);
  writer.PushString(error);
  writer.PushInt(uid);
  writer.PushInt(gid);
  writer.PushInt(wall_time);
  writer.PushInt(rss);
  writer.PushInt(proc_num);
  writer.PushInt(fsize);
  writer.PushStrings(dirs);
  return ret;
}

bool SandboxOptions::Deserialize(const std::vector<uint8_t>& vec) {
  Reader reader(vec);
  boxdir = reader.ReadString();
  command = reader.ReadStrings();
  envs = reader.ReadStrings();
  workdir = reader.ReadString();
  output = reader.ReadString();
  error = reader.ReadString();
  uid = reader.ReadInt();
  gid = reader.ReadInt();
  wall_time = reader.ReadInt();
  rss = reader.ReadInt();
  proc_num = reader.ReadInt();
  fsize = reader.ReadInt();
  dirs = reader.ReadStrings();
  return reader.Ok() && !command.empty();
}

void SandboxOptions::ToCJailCtx(CJailCtxClass& ret) const {
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  // default: preservefd, fd_input
  ctx.sharenet = 0;
  if (!output.empty()) ctx.redir_output = const_cast<char*>(output.data());
  if (!error.empty()) ctx.redir_error = const_cast<char*>(error.data());
  for (auto& i : command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  for (auto& i : envs) ret.env_buf_.push_back(i.data());
  ret.env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  ctx.chroot = const_cast<char*>(boxdir.data());
  ctx.working_dir = const_cast<char*>(workdir.data());
  ctx.cpuset = nullptr;
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  // read-only bind mounts; pointers into mnt_buf_ must stay valid
  ret.mnt_buf_.reserve(dirs.size());
  for (auto& i : dirs) {
    ret.mnt_buf_.emplace_back();
    struct jail_mount_ctx& mnt_ctx = ret.mnt_buf_.back();
    mnt_ctx.type = const_cast<char*>("bind");
    mnt_ctx.source = mnt_ctx.target = const_cast<char*>(i.data());
    mnt_ctx.fstype = mnt_ctx.data = nullptr;
    mnt_ctx.flags = MS_RDONLY;
    mnt_list_add(ret.mnt_list_, &mnt_ctx);
  }
  ctx.mount_cfg = ret.mnt_list_;
}
