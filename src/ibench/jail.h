#ifndef IBENCH_JAIL_H_
#define IBENCH_JAIL_H_

#include <string>
#include <vector>

#include "executor.h"
#include "sandbox.h"

// uid/gid of the jailed program
constexpr int kJailUid = 65534;
constexpr int kJailProcLimit = 50;
constexpr long kJailTmpSizeKiB = 64 * 1024;

// cjail backend through the ibench-sandbox helper; requires root.
// Cancellation is only honored before the program starts.
class JailExecutor : public Executor {
 public:
  // the jailed run, without touching the filesystem
  SandboxOptions Options(const LanguageProfile&, const ExecutionArtifact&, const RunLimits&) const;

  ExecutionResult Run(const LanguageProfile&, const ExecutionArtifact&,
                      const RunLimits&, const CancelToken*) const override;
};

#endif  // IBENCH_JAIL_H_
