#include "jail.h"

#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <chrono>
#include <algorithm>
#include <cstring>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "sandbox_exec.h"
#include "utils.h"

namespace {

const std::vector<std::string> kSystemDirs = {"/usr", "/lib", "/lib64", "/etc/alternatives", "/bin"};
const char kStdoutName[] = "stdout";
const char kStderrName[] = "stderr";

// cjail execs without a PATH lookup
std::vector<std::string> JailCommand(std::vector<std::string> argv) {
  if (!argv.empty() && argv[0].find('/') == std::string::npos) argv.insert(argv.begin(), "/usr/bin/env");
  return argv;
}

class TmpMount {
  fs::path path_;
  bool mounted_;
 public:
  explicit TmpMount(const fs::path& path) : path_(path), mounted_(MountTmpfs(path, kJailTmpSizeKiB)) {}
  ~TmpMount() {
    if (mounted_) IGNORE_RETURN(Umount(path_));
  }
  TmpMount(const TmpMount&) = delete;
  TmpMount& operator=(const TmpMount&) = delete;
  bool Mounted() const { return mounted_; }
};

ExecutionResult JailFailure(const std::string& msg) {
  ExecutionResult ret;
  ret.error = msg;
  ret.stderr_str = msg;
  return ret;
}

// mirror the host's symlinked top-level directories (e.g. /bin -> usr/bin)
bool PrepareBox(const fs::path& box, const SandboxOptions& opt, const std::vector<std::string>& links) {
  for (auto& i : opt.dirs) {
    if (!CreateDirs(box / fs::path(i).relative_path())) return false;
  }
  for (auto& i : links) {
    std::error_code ec;
    fs::path target = fs::read_symlink(i, ec);
    fs::path link = box / fs::path(i).relative_path();
    if (!ec) fs::create_directory_symlink(target, link, ec);
    if (ec) {
      spdlog::warn("Failed linking {} in jail: {}", i, ec.message());
      return false;
    }
  }
  return true;
}

bool CreateOutputFile(const fs::path& path) {
  if (!WriteFile(path, "", fs::perms::owner_read | fs::perms::owner_write)) return false;
  if (chown(path.c_str(), kJailUid, kJailUid) < 0) {
    spdlog::warn("Failed chown {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  return true;
}

} // namespace

SandboxOptions JailExecutor::Options(
    const LanguageProfile& profile, const ExecutionArtifact& artifact, const RunLimits& limits) const {
  fs::path box = artifact.Box();
  fs::path workdir = InsideBox(box, artifact.Workdir());
  SandboxOptions opt;
  opt.boxdir = box;
  opt.command = JailCommand(profile.RunCommand(InsideBox(box, artifact.Program(profile))));
  opt.envs = {"PATH=/usr/local/bin:/usr/bin:/bin", "HOME=/tmp"};
  opt.workdir = workdir;
  opt.output = workdir / kStdoutName;
  opt.error = workdir / kStderrName;
  opt.uid = opt.gid = kJailUid;
  opt.wall_time = limits.timeout_ms * 1000;
  opt.rss = limits.memory_limit / 1024;
  opt.proc_num = kJailProcLimit;
  opt.fsize = std::max(1L, limits.max_output / 1024);
  opt.dirs = kSystemDirs;
  return opt;
}

ExecutionResult JailExecutor::Run(const LanguageProfile& profile, const ExecutionArtifact& artifact,
                                  const RunLimits& limits, const CancelToken* cancel) const {
  if (geteuid() != 0) return JailFailure("Jail sandbox requires root");
  if (cancel && cancel->IsCancelled()) {
    ExecutionResult ret;
    ret.cancelled = true;
    ret.error = "Execution cancelled";
    return ret;
  }

  SandboxOptions opt = Options(profile, artifact, limits);
  std::vector<std::string> links;
  opt.FilterDirs(links);
  fs::path box = artifact.Box();
  if (!PrepareBox(box, opt, links)) return JailFailure("Failed to prepare jail");
  fs::path tmp = box / "tmp";
  if (!CreateDirs(tmp)) return JailFailure("Failed to prepare jail");
  TmpMount tmp_mount(tmp);
  if (!tmp_mount.Mounted()) return JailFailure("Failed to mount jail tmpfs");
  {
    std::error_code ec;
    fs::permissions(tmp, fs::perms::all | fs::perms::sticky_bit, ec);
  }
  fs::path out = artifact.Workdir() / kStdoutName, err = artifact.Workdir() / kStderrName;
  if (!CreateOutputFile(out) || !CreateOutputFile(err)) return JailFailure("Failed to prepare jail output");

  auto start = std::chrono::steady_clock::now();
  struct cjail_result res = SandboxExec(opt);
  ExecutionResult ret;
  ret.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
  if (res.timekill == -1) {
    return JailFailure(fmt::format("Sandbox failure: {}", strerror(res.oomkill)));
  }

  bool out_truncated = false, err_truncated = false;
  if (!ReadFile(out, ret.stdout_str, limits.max_output, &out_truncated) ||
      !ReadFile(err, ret.stderr_str, limits.max_output, &err_truncated)) {
    spdlog::warn("Failed reading jail output: box={}", opt.boxdir);
  }
  if (res.info.si_code == CLD_EXITED) {
    ret.exit_code = res.info.si_status;
  } else {
    ret.signal = res.info.si_status;
    ret.exit_code = 128 + ret.signal;
  }
  ret.memory_usage = res.rus.ru_maxrss * 1024L;

  if (res.timekill) {
    ret.timed_out = true;
    ret.error = "Execution timed out";
  } else if (res.oomkill) {
    ret.error = "Memory limit exceeded";
  } else if (ret.signal == SIGXFSZ || out_truncated || err_truncated) {
    ret.output_truncated = true;
    ret.error = "Output limit exceeded";
  } else if (ret.signal) {
    ret.error = fmt::format("Killed by signal {} ({})", ret.signal, strsignal(ret.signal));
  }
  ret.success = ret.exit_code == 0 && !ret.error;
  spdlog::debug("Jail finished: box={} exit_code={} signal={} timekill={} oomkill={}",
                opt.boxdir, ret.exit_code, ret.signal, res.timekill, res.oomkill);
  return ret;
}
