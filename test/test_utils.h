#ifndef TEST_TEST_UTILS_H_
#define TEST_TEST_UTILS_H_

#include <string>
#include <vector>
#include <filesystem>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <ibench/execution.h>

namespace fs = std::filesystem;

namespace nlohmann {
// gtest would otherwise print json as a container of itself
inline void PrintTo(const json& val, std::ostream* os) {
  *os << val.dump(-1, ' ', false, json::error_handler_t::replace);
}
} // namespace nlohmann

// every box created by the tests lives here; removed after the run
extern const fs::path kTestScratch;

// direct execution under kTestScratch with a short timeout
ExecutionConfig TestConfig(long timeout_ms = 5000);

TestCase MakeTestCase(const std::string& id, const nlohmann::json& input, const nlohmann::json& expected);

// true if every named tool resolves through PATH
bool HasTools(const std::vector<std::string>& tools);
// tools the harness of lang needs at compile and run time
std::vector<std::string> ToolchainOf(Language lang);

// number of entries directly under dir; 0 if it does not exist
size_t CountEntries(const fs::path& dir);

#define SKIP_WITHOUT_TOOLCHAIN(lang) \
  if (!HasTools(ToolchainOf(lang))) GTEST_SKIP() << "toolchain not installed: " << LanguageName(lang)

#endif // TEST_TEST_UTILS_H_
