#include "test_utils.h"

#include <unistd.h>
#include <cstdlib>

#include "utils.h"

const fs::path kTestScratch = "/tmp/ibench_test";

namespace {

// lookup through PATH, or the path itself if it contains '/'
bool FindExecutable(const std::string& name) {
  if (name.empty()) return false;
  if (name.find('/') != std::string::npos) return access(name.c_str(), X_OK) == 0;
  const char* path_env = getenv("PATH");
  if (!path_env) return false;
  std::string paths = path_env;
  for (size_t pos = 0; pos <= paths.size();) {
    size_t nxt = paths.find(':', pos);
    if (nxt == std::string::npos) nxt = paths.size();
    std::string dir = paths.substr(pos, nxt - pos);
    if (dir.empty()) dir = ".";
    if (access((fs::path(dir) / name).c_str(), X_OK) == 0) return true;
    pos = nxt + 1;
  }
  return false;
}

} // namespace

ExecutionConfig TestConfig(long timeout_ms) {
  ExecutionConfig config;
  config.scratch_dir = kTestScratch;
  config.timeout_ms = timeout_ms;
  config.max_output = 1L << 20;
  return config;
}

TestCase MakeTestCase(const std::string& id, const nlohmann::json& input, const nlohmann::json& expected) {
  TestCase ret;
  ret.id = id;
  ret.name = id;
  ret.input = input;
  ret.expected_output = expected;
  ret.points = 1;
  return ret;
}

bool HasTools(const std::vector<std::string>& tools) {
  for (auto& i : tools) {
    if (!FindExecutable(i)) return false;
  }
  return true;
}

std::vector<std::string> ToolchainOf(Language lang) {
  switch (lang) {
    case Language::TYPESCRIPT: return {"npx", "node", "tsx"};
    case Language::JAVASCRIPT: return {"node"};
    case Language::PYTHON: return {"python3"};
    case Language::JAVA: return {"javac", "java"};
    case Language::GO: return {"go"};
    case Language::RUST: return {"rustc"};
    case Language::CSHARP: return {"mcs", "mono"};
    case Language::CPP: return {"g++"};
  }
  __builtin_unreachable();
}

size_t CountEntries(const fs::path& dir) {
  std::error_code ec;
  size_t ret = 0;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) ret++;
  return ret;
}
