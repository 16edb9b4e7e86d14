#include "executor.h"

#include "container.h"
#include "jail.h"
#include "process.h"

ExecutionResult DirectExecutor::Run(const LanguageProfile& profile, const ExecutionArtifact& artifact,
                                    const RunLimits& limits, const CancelToken* cancel) const {
  ProcessOptions opt;
  opt.timeout_ms = limits.timeout_ms;
  opt.workdir = artifact.Workdir();
  opt.max_output = limits.max_output;
  opt.cancel = cancel;
  return RunProcess(profile.RunCommand(artifact.Program(profile)), opt);
}

std::unique_ptr<Executor> MakeExecutor(const ExecutionConfig& config) {
  if (!config.use_sandbox) return std::make_unique<DirectExecutor>();
  switch (config.sandbox_backend) {
    case SandboxBackend::CONTAINER: return std::make_unique<ContainerExecutor>(config);
    case SandboxBackend::JAIL: return std::make_unique<JailExecutor>();
  }
  __builtin_unreachable();
}
