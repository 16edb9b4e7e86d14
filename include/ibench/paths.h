#ifndef INCLUDE_IBENCH_PATHS_H_
#define INCLUDE_IBENCH_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

// default scratch directory for execution boxes
extern fs::path kScratchRoot;

namespace internal {

// location of the ibench-sandbox helper; overridden by tests
extern fs::path kDataDir;

} // internal

fs::path SandboxHelperPath();

#endif  // INCLUDE_IBENCH_PATHS_H_
