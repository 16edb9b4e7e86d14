#include "container.h"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "process.h"
#include "utils.h"

const char kContainerBoxMount[] = "/box";

namespace {

constexpr long kRemoveTimeoutMs = 10000;
// a SIGTERM from busybox `timeout` surfaces as 128 + 15
constexpr int kTerminatedExit = 143;

} // namespace

std::string ContainerExecutor::ContainerName(const ExecutionArtifact& artifact) const {
  return "ibench-" + artifact.Id();
}

std::vector<std::string> ContainerExecutor::Command(
    const LanguageProfile& profile, const ExecutionArtifact& artifact, const RunLimits& limits) const {
  fs::path mount = kContainerBoxMount;
  fs::path program = mount / InsideBox(artifact.Box(), artifact.Program(profile)).relative_path();
  fs::path workdir = mount / InsideBox(artifact.Box(), artifact.Workdir()).relative_path();
  long timeout_s = std::max(1L, (limits.timeout_ms + 999) / 1000);
  std::vector<std::string> ret = {
    config_.docker_binary, "run", "--rm",
    "--name", ContainerName(artifact),
    "--network", "none",
    "--memory", std::to_string(limits.memory_limit),
    "--memory-swap", std::to_string(limits.memory_limit),
    "--cpus", "1",
    "--pids-limit", "50",
    "--read-only",
    "--tmpfs", "/tmp:rw,noexec,nosuid,size=64m",
    "--volume", artifact.Box().string() + ":" + mount.string() + ":ro",
    "--workdir", workdir,
    "--user", "65534:65534",
    "--env", "HOME=/tmp",
    profile.ContainerImage(config_),
    "timeout", std::to_string(timeout_s) + "s",
  };
  auto run = profile.RunCommand(program);
  ret.insert(ret.end(), run.begin(), run.end());
  return ret;
}

ExecutionResult ContainerExecutor::Run(const LanguageProfile& profile, const ExecutionArtifact& artifact,
                                       const RunLimits& limits, const CancelToken* cancel) const {
  ProcessOptions opt;
  opt.timeout_ms = limits.timeout_ms + config_.sandbox_overhead_ms;
  opt.workdir = artifact.Workdir();
  opt.max_output = limits.max_output;
  opt.cancel = cancel;
  ExecutionResult ret = RunProcess(Command(profile, artifact, limits), opt);

  if (ret.timed_out || ret.cancelled || ret.output_truncated) {
    // killing the client does not stop the container
    spdlog::info("Removing container: name={}", ContainerName(artifact));
    ProcessOptions rm_opt;
    rm_opt.timeout_ms = kRemoveTimeoutMs;
    auto rm = RunProcess({config_.docker_binary, "rm", "-f", ContainerName(artifact)}, rm_opt);
    if (!rm.success) {
      spdlog::warn("Failed to remove container: name={} error={}",
                   ContainerName(artifact), rm.error.value_or(rm.stderr_str));
    }
  } else if (ret.exit_code == kContainerTimeoutExit ||
             (ret.exit_code == kTerminatedExit && ret.elapsed_ms >= limits.timeout_ms)) {
    ret.success = false;
    ret.timed_out = true;
    ret.error = "Execution timed out";
  }
  return ret;
}
