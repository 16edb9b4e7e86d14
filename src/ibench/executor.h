#ifndef IBENCH_EXECUTOR_H_
#define IBENCH_EXECUTOR_H_

#include <memory>

#include <ibench/execution.h>
#include "artifact.h"
#include "language.h"

struct RunLimits {
  long timeout_ms;
  long memory_limit; // bytes; not enforced by direct execution
  long max_output; // bytes per stream
};

// Runs the run phase of a prepared box. Every backend reports through the same
//   ExecutionResult contract as RunProcess.
class Executor {
 public:
  virtual ~Executor() = default;
  virtual ExecutionResult Run(const LanguageProfile&, const ExecutionArtifact&,
                              const RunLimits&, const CancelToken*) const = 0;
};

class DirectExecutor : public Executor {
 public:
  ExecutionResult Run(const LanguageProfile&, const ExecutionArtifact&,
                      const RunLimits&, const CancelToken*) const override;
};

std::unique_ptr<Executor> MakeExecutor(const ExecutionConfig&);

#endif  // IBENCH_EXECUTOR_H_
