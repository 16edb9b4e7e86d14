#ifndef IBENCH_SANDBOX_H_
#define IBENCH_SANDBOX_H_

#include <string>
#include <vector>
#include <cstdint>

#include <cjail/cjail.h>

class SandboxOptions;
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  std::vector<struct jail_mount_ctx> mnt_buf_;
  struct jail_mount_list* mnt_list_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() : mnt_list_(mnt_list_new()) {}
  ~CJailCtxClass() {
    mnt_list_free(mnt_list_);
  }
  CJailCtxClass(const CJailCtxClass&) = delete;
  CJailCtxClass& operator=(const CJailCtxClass&) = delete;
  struct cjail_ctx& GetCtx() { return ctx_; }

  friend class SandboxOptions;
};

// One jailed run. Paths other than boxdir are inside the box.
class SandboxOptions {
 public:
  std::string boxdir;
  std::vector<std::string> command;
  std::vector<std::string> envs;
  std::string workdir, output, error;
  int uid, gid;
  long wall_time; // us
  long rss; // KiB
  int proc_num;
  long fsize; // KiB
  // read-only bind mounts of host directories at the same path
  std::vector<std::string> dirs;

  SandboxOptions() :
      uid(65534), gid(65534),
      wall_time(0),
      rss(0),
      proc_num(0),
      fsize(0) {}

  // drop directories missing on this host; symlinked ones are moved to links
  void FilterDirs(std::vector<std::string>& links);

  // the helper is exec'd on the same machine, so the format only needs to
  //   round-trip between two builds of this file
  std::vector<uint8_t> Serialize() const;
  // false if the buffer is truncated or malformed
  bool Deserialize(const std::vector<uint8_t>&);

  // fills ctx; ctx refers to strings of this object, which must outlive it
  void ToCJailCtx(CJailCtxClass& ctx) const;
};

#endif  // IBENCH_SANDBOX_H_
