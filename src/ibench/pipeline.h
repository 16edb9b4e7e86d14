#ifndef IBENCH_PIPELINE_H_
#define IBENCH_PIPELINE_H_

#include <string>

#include <ibench/execution.h>
#include "executor.h"
#include "language.h"

#define ENUM_PHASE_ \
  X(PREPARING, "preparing") \
  X(COMPILING, "compiling") \
  X(RUNNING, "running") \
  X(DONE, "done")
enum class Phase {
#define X(name, str) name,
  ENUM_PHASE_
#undef X
};

const char* PhaseName(Phase);

// Run timeout: the test's override, else the challenge time limit, else the configured default.
long RunTimeout(const TestCase&, const ChallengeLimits&, const ExecutionConfig&);
long MemoryLimit(const ChallengeLimits&, const ExecutionConfig&);

// Preparing -> (Compiling) -> Running -> Done for one test case. The box
//   exists only for the duration of the call.
TestCaseResult RunPipeline(
    const LanguageProfile&, const std::string& code, const TestCase&, const ChallengeLimits&,
    const ExecutionConfig&, const Executor&, const CancelToken*);

#endif  // IBENCH_PIPELINE_H_
