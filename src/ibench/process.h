#ifndef IBENCH_PROCESS_H_
#define IBENCH_PROCESS_H_

#include <string>
#include <vector>
#include <filesystem>

#include <ibench/execution.h>

struct ProcessOptions {
  long timeout_ms; // 0 for no limit
  std::filesystem::path workdir; // empty to inherit
  long max_output; // bytes per stream, 0 for no limit
  const CancelToken* cancel;

  ProcessOptions() : timeout_ms(0), max_output(0), cancel(nullptr) {}
};

// Spawn argv (PATH lookup on argv[0]) in its own process group with stdin from /dev/null.
// Every failure (empty argv, launch failure, non-zero exit, timeout, cancellation)
//   is reported in the returned result; this never throws.
// The whole process group is killed with SIGKILL on timeout or cancellation.
ExecutionResult RunProcess(const std::vector<std::string>& argv, const ProcessOptions&);

#endif  // IBENCH_PROCESS_H_
