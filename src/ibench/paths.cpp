#include "paths.h"

fs::path kScratchRoot = "/tmp/ibench_scratch";

namespace internal {
fs::path kDataDir = fs::path(IBENCH_DATA_DIR);
} // internal

fs::path SandboxHelperPath() {
  return internal::kDataDir / "ibench-sandbox";
}

const char kWorkdirRelative[] = "workdir";
fs::path Workdir(fs::path&& path) {
  path /= kWorkdirRelative;
  return path;
}

fs::path ExecutionBoxPath(const fs::path& scratch, const std::string& id) {
  return scratch / id;
}
fs::path ExecutionBoxWorkdir(const fs::path& scratch, const std::string& id) {
  return Workdir(ExecutionBoxPath(scratch, id));
}
fs::path ExecutionBoxSource(const fs::path& scratch, const std::string& id, const std::string& source_name) {
  return ExecutionBoxWorkdir(scratch, id) / source_name;
}
fs::path ExecutionBoxProgram(const fs::path& scratch, const std::string& id, const std::string& program_name) {
  return ExecutionBoxWorkdir(scratch, id) / program_name;
}
