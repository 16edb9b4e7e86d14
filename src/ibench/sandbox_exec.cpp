#include "sandbox_exec.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <ibench/paths.h>

namespace {

bool WriteAll(int fd, const void* buf, size_t len) {
  const char* ptr = (const char*)buf;
  while (len) {
    ssize_t n = write(fd, ptr, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n, len -= n;
  }
  return true;
}

bool ReadAll(int fd, void* buf, size_t len) {
  char* ptr = (char*)buf;
  while (len) {
    ssize_t n = read(fd, ptr, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n, len -= n;
  }
  return true;
}

} // namespace

struct cjail_result SandboxExec(const SandboxOptions& opt) {
  struct cjail_result ret = {};
  int inpipe[2] = {-1, -1}, outpipe[2] = {-1, -1};
  pid_t pid;
  auto helper = SandboxHelperPath();
  if (pipe2(inpipe, O_CLOEXEC) < 0 || pipe2(outpipe, O_CLOEXEC) < 0) goto err;
  pid = fork();
  if (pid < 0) goto err;
  if (pid == 0) {
    dup2(inpipe[1], 1);
    dup2(outpipe[0], 0);
    execl(helper.c_str(), helper.c_str(), nullptr);
    _exit(1);
  }
  {
    spdlog::debug("SandboxExec pid={} childpid={} boxdir={} command={}",
                  getpid(), pid, opt.boxdir, fmt::format("{}", opt.command));
    close(inpipe[1]);
    close(outpipe[0]);
    inpipe[1] = outpipe[0] = -1;
    auto vec = opt.Serialize();
    long size = vec.size();
    bool ok = WriteAll(outpipe[1], &size, sizeof(size)) && WriteAll(outpipe[1], vec.data(), vec.size());
    // the jailed program inherits the helper's stdin and sees EOF
    close(outpipe[1]);
    outpipe[1] = -1;
    if (!ok || !ReadAll(inpipe[0], &ret, sizeof(ret))) {
      int err = errno ? errno : EPIPE;
      kill(pid, SIGKILL);
      waitpid(pid, nullptr, 0);
      close(inpipe[0]);
      errno = err;
      spdlog::warn("SandboxExec error: helper={} errno={} {}", helper.c_str(), errno, strerror(errno));
      ret = {};
      ret.oomkill = errno;
      ret.timekill = -1;
      return ret;
    }
    close(inpipe[0]);
  }
  waitpid(pid, nullptr, 0);
  if (ret.timekill == -1) {
    spdlog::warn("cjail_exec error: errno={} {}", ret.oomkill, strerror(ret.oomkill));
  }
  return ret;
err:
  spdlog::warn("SandboxExec error: errno={} {}", errno, strerror(errno));
  for (int fd : {inpipe[0], inpipe[1], outpipe[0], outpipe[1]}) {
    if (fd >= 0) close(fd);
  }
  ret.oomkill = errno;
  ret.timekill = -1;
  return ret;
}
