#include "pipeline.h"

#include <cmath>

#include <spdlog/spdlog.h>

#include "artifact.h"
#include "compare.h"
#include "process.h"
#include "utils.h"

const char* PhaseName(Phase phase) {
  switch (phase) {
#define X(name, str) case Phase::name: return str;
    ENUM_PHASE_
#undef X
  }
  __builtin_unreachable();
}

// non-positive overrides would disable the limit; they fall back to the default
long RunTimeout(const TestCase& test_case, const ChallengeLimits& limits, const ExecutionConfig& config) {
  if (test_case.timeout_ms && *test_case.timeout_ms > 0) return *test_case.timeout_ms;
  if (limits.time_limit_s && *limits.time_limit_s > 0) return (long)std::ceil(*limits.time_limit_s * 1000);
  return config.timeout_ms;
}

long MemoryLimit(const ChallengeLimits& limits, const ExecutionConfig& config) {
  if (limits.memory_limit_mb && *limits.memory_limit_mb > 0) return *limits.memory_limit_mb * (1L << 20);
  return config.memory_limit;
}

namespace {

// a result for executions that never reached the run phase
TestCaseResult PhaseFailure(const TestCase& test_case, Verdict verdict, const std::string& error) {
  TestCaseResult ret;
  ret.test_case_id = test_case.id;
  ret.expected_output = test_case.expected_output;
  ret.verdict = verdict;
  ret.error = error;
  ret.execution.stderr_str = error;
  ret.execution.error = error;
  return ret;
}

// some compilers (mcs) report errors on stdout
std::string CompileMessage(const ExecutionResult& res) {
  if (res.error) return *res.error;
  if (std::string msg = Trim(res.stderr_str); !msg.empty()) return msg;
  if (std::string msg = Trim(res.stdout_str); !msg.empty()) return msg;
  return "exit code " + std::to_string(res.exit_code);
}

} // namespace

TestCaseResult RunPipeline(
    const LanguageProfile& profile, const std::string& code, const TestCase& test_case,
    const ChallengeLimits& limits, const ExecutionConfig& config, const Executor& executor,
    const CancelToken* cancel) {
  ExecutionArtifact artifact(config.scratch_dir);
  auto SetPhase = [&](Phase phase) {
    spdlog::debug("Pipeline: id={} test={} phase={}", artifact.Id(), test_case.id, PhaseName(phase));
  };
  SetPhase(Phase::PREPARING);
  if (!artifact.Ready()) {
    return PhaseFailure(test_case, Verdict::EXECUTION_ERROR, "Failed to create execution directory");
  }
  if (!WriteFile(artifact.Source(profile), profile.Harness(code, test_case.input), kPerm644)) {
    return PhaseFailure(test_case, Verdict::EXECUTION_ERROR, "Failed to write harness source");
  }

  long compile_ms = 0;
  if (profile.HasCompileStep()) {
    SetPhase(Phase::COMPILING);
    fs::path program = artifact.Program(profile);
    if (profile.ProgramIsDirectory() && !CreateDirs(program, kPerm755)) {
      return PhaseFailure(test_case, Verdict::EXECUTION_ERROR, "Failed to create compile output directory");
    }
    ProcessOptions opt;
    opt.timeout_ms = config.timeout_ms;
    opt.workdir = artifact.Workdir();
    opt.max_output = config.max_output;
    opt.cancel = cancel;
    ExecutionResult res = RunProcess(profile.CompileCommand(artifact.Source(profile), program, config), opt);
    compile_ms = res.elapsed_ms;
    if (!res.success) {
      TestCaseResult ret = res.cancelled ?
          PhaseFailure(test_case, Verdict::CANCELLED, "Execution cancelled") :
          PhaseFailure(test_case, Verdict::COMPILE_FAILED, "Compilation failed: " + CompileMessage(res));
      ret.compile_ms = compile_ms;
      SetPhase(Phase::DONE);
      spdlog::info("Compile failed: id={} test={} language={} time={}ms",
                   artifact.Id(), test_case.id, LanguageName(profile.Lang()), compile_ms);
      return ret;
    }
  }

  SetPhase(Phase::RUNNING);
  RunLimits run_limits;
  run_limits.timeout_ms = RunTimeout(test_case, limits, config);
  run_limits.memory_limit = MemoryLimit(limits, config);
  run_limits.max_output = config.max_output;
  ExecutionResult exec = executor.Run(profile, artifact, run_limits, cancel);
  TestCaseResult ret = ParseExecutionResult(
      exec, test_case, test_case.float_tolerance.value_or(config.float_tolerance));
  ret.compile_ms = compile_ms;
  SetPhase(Phase::DONE);
  spdlog::info("Execute finished: id={} test={} language={} verdict={} time={}ms exit_code={}",
               artifact.Id(), test_case.id, LanguageName(profile.Lang()),
               VerdictToAbr(ret.verdict), ret.elapsed_ms, exec.exit_code);
  return ret;
}
