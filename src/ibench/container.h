#ifndef IBENCH_CONTAINER_H_
#define IBENCH_CONTAINER_H_

#include <string>
#include <vector>

#include "executor.h"

// exit status of coreutils `timeout` when the limit is hit
constexpr int kContainerTimeoutExit = 124;
// where the box is mounted inside the container
extern const char kContainerBoxMount[];

// Runs the program with `docker run`: no network, memory/cpu/pids caps,
//   read-only root with a small /tmp, box mounted read-only, unprivileged user.
// config must outlive the executor.
class ContainerExecutor : public Executor {
  const ExecutionConfig& config_;
 public:
  explicit ContainerExecutor(const ExecutionConfig& config) : config_(config) {}

  std::string ContainerName(const ExecutionArtifact&) const;
  std::vector<std::string> Command(const LanguageProfile&, const ExecutionArtifact&, const RunLimits&) const;

  ExecutionResult Run(const LanguageProfile&, const ExecutionArtifact&,
                      const RunLimits&, const CancelToken*) const override;
};

#endif  // IBENCH_CONTAINER_H_
