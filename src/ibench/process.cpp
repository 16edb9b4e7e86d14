#include "process.h"

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <chrono>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "utils.h"

namespace {

constexpr int kPollIntervalMs = 20;
// a descendant that left the process group may hold the pipes open
constexpr long kDrainGraceMs = 500;
constexpr size_t kReadBufSize = 65536;

using Clock = std::chrono::steady_clock;

long MsSince(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

class Pipe {
  int fd_[2];
 public:
  Pipe() : fd_{-1, -1} {}
  ~Pipe() { CloseRead(); CloseWrite(); }
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  bool Open() { return pipe2(fd_, O_CLOEXEC) == 0; }
  int Read() const { return fd_[0]; }
  int Write() const { return fd_[1]; }
  void CloseRead() { if (fd_[0] >= 0) close(fd_[0]); fd_[0] = -1; }
  void CloseWrite() { if (fd_[1] >= 0) close(fd_[1]); fd_[1] = -1; }
};

struct Stream {
  Pipe* pipe;
  std::string* buf;
  bool open;
};

ExecutionResult LaunchFailure(const std::string& msg) {
  ExecutionResult ret;
  ret.error = msg;
  ret.stderr_str = msg;
  return ret;
}

} // namespace

ExecutionResult RunProcess(const std::vector<std::string>& argv, const ProcessOptions& opt) {
  if (argv.empty() || argv[0].empty()) return LaunchFailure("No command provided");
  if (opt.cancel && opt.cancel->IsCancelled()) {
    ExecutionResult ret;
    ret.cancelled = true;
    ret.error = "Execution cancelled";
    return ret;
  }
  spdlog::debug("RunProcess: command={} workdir={} timeout={}",
                fmt::format("{}", argv), opt.workdir.c_str(), opt.timeout_ms);

  // everything the child touches is prepared before fork
  std::vector<char*> c_argv;
  for (auto& i : argv) c_argv.push_back(const_cast<char*>(i.c_str()));
  c_argv.push_back(nullptr);
  std::string workdir = opt.workdir.string();

  Pipe out, err, exec_err;
  if (!out.Open() || !err.Open() || !exec_err.Open()) {
    return LaunchFailure(fmt::format("Failed to create pipes: {}", strerror(errno)));
  }

  auto start = Clock::now();
  pid_t pid = fork();
  if (pid < 0) return LaunchFailure(fmt::format("Failed to fork: {}", strerror(errno)));
  if (pid == 0) {
    setpgid(0, 0);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) dup2(devnull, 0);
    dup2(out.Write(), 1);
    dup2(err.Write(), 2);
    if (workdir.empty() || chdir(workdir.c_str()) == 0) execvp(c_argv[0], c_argv.data());
    int errno_ = errno;
    IGNORE_RETURN(write(exec_err.Write(), &errno_, sizeof(errno_)));
    _exit(127);
  }
  setpgid(pid, pid); // the child may not have run yet
  out.CloseWrite();
  err.CloseWrite();
  exec_err.CloseWrite();

  {
    // closed by exec on success, or carries the errno of chdir/exec
    int child_errno = 0;
    ssize_t n;
    while ((n = read(exec_err.Read(), &child_errno, sizeof(child_errno))) < 0 && errno == EINTR);
    if (n == (ssize_t)sizeof(child_errno)) {
      waitpid(pid, nullptr, 0);
      spdlog::info("Spawn failed: command={} errno={}", argv[0], child_errno);
      return LaunchFailure(fmt::format("Failed to execute {}: {}", argv[0], strerror(child_errno)));
    }
  }

  ExecutionResult ret;
  fcntl(out.Read(), F_SETFL, O_NONBLOCK);
  fcntl(err.Read(), F_SETFL, O_NONBLOCK);
  Stream streams[2] = {{&out, &ret.stdout_str, true}, {&err, &ret.stderr_str, true}};
  std::vector<char> buf(kReadBufSize);

  bool exited = false, killed = false, reap_failed = false;
  int status = 0;
  struct rusage usage = {};
  Clock::time_point exit_time;
  auto KillGroup = [&]() {
    kill(-pid, SIGKILL);
    killed = true;
  };

  while (true) {
    if (!exited) {
      pid_t r = wait4(pid, &status, WNOHANG, &usage);
      if (r == pid) {
        exited = true;
        exit_time = Clock::now();
        ret.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(exit_time - start).count();
        // leftover descendants would otherwise keep the pipes open
        kill(-pid, SIGKILL);
      } else if (r < 0 && errno != EINTR) {
        spdlog::warn("wait4 failed: pid={} {}", pid, strerror(errno));
        exited = true;
        reap_failed = true;
        exit_time = Clock::now();
        ret.elapsed_ms = MsSince(start);
        kill(-pid, SIGKILL);
      }
    }
    if (exited) {
      if (!streams[0].open && !streams[1].open) break;
      if (MsSince(exit_time) > kDrainGraceMs) break;
    } else if (!killed) {
      if (opt.timeout_ms > 0 && MsSince(start) >= opt.timeout_ms) {
        ret.timed_out = true;
        KillGroup();
      } else if (opt.cancel && opt.cancel->IsCancelled()) {
        ret.cancelled = true;
        KillGroup();
      }
    }

    struct pollfd fds[2];
    Stream* polled[2];
    nfds_t nfds = 0;
    for (auto& i : streams) {
      if (!i.open) continue;
      fds[nfds] = {i.pipe->Read(), POLLIN, 0};
      polled[nfds++] = &i;
    }
    if (poll(fds, nfds, kPollIntervalMs) <= 0) continue;
    for (nfds_t i = 0; i < nfds; i++) {
      if (!fds[i].revents) continue;
      Stream& stream = *polled[i];
      while (true) {
        ssize_t n = read(fds[i].fd, buf.data(), buf.size());
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
          if (n == 0) stream.open = false;
          break;
        }
        if (ret.output_truncated) continue; // drain and discard
        stream.buf->append(buf.data(), n);
        if (opt.max_output > 0 && (long)stream.buf->size() > opt.max_output) {
          stream.buf->resize(opt.max_output);
          ret.output_truncated = true;
          if (!exited && !killed) KillGroup();
        }
      }
    }
  }

  if (reap_failed) {
    ret.error = "Failed to collect process status";
    return ret;
  }
  if (WIFEXITED(status)) {
    ret.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    ret.signal = WTERMSIG(status);
    ret.exit_code = 128 + ret.signal;
  }
  ret.memory_usage = usage.ru_maxrss * 1024L;
  ret.success = ret.exit_code == 0 && !ret.timed_out && !ret.cancelled && !ret.output_truncated;
  if (ret.timed_out) {
    ret.error = "Execution timed out";
  } else if (ret.cancelled) {
    ret.error = "Execution cancelled";
  } else if (ret.output_truncated) {
    ret.error = "Output limit exceeded";
  } else if (ret.signal) {
    ret.error = fmt::format("Killed by signal {} ({})", ret.signal, strsignal(ret.signal));
  }
  spdlog::debug("RunProcess finished: pid={} exit_code={} signal={} elapsed={} timed_out={}",
                pid, ret.exit_code, ret.signal, ret.elapsed_ms, ret.timed_out);
  return ret;
}
