#include <signal.h>
#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <ibench/config.h>
#include <ibench/engine.h>
#include <ibench/logger.h>
#include <ibench/utils.h>

namespace fs = std::filesystem;

namespace {

constexpr int kExitAllPassed = 0;
constexpr int kExitError = 1;
constexpr int kExitSomeFailed = 2;

struct Invocation {
  std::string language;
  fs::path source, tests;
  ExecutionConfig config;
};

bool ReadText(const fs::path& path, std::string& content) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return false;
  std::ostringstream ss;
  ss << fin.rdbuf();
  content = ss.str();
  return true;
}

bool ParseArgs(int argc, char** argv, Invocation& inv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "ibench-exec");
  parser.add_argument("-l", "--language")
    .required()
    .help("Language of the candidate source");
  parser.add_argument("-s", "--source")
    .required()
    .help("Path of the candidate source file");
  parser.add_argument("-t", "--tests")
    .required()
    .help("Path of a JSON array of test cases");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of test cases executed at once");
  parser.add_argument("--sandbox")
    .default_value(false)
    .implicit_value(true)
    .help("Run candidates in a sandbox");
  parser.add_argument("--backend")
    .help("Sandbox backend: container or jail");
  parser.add_argument("--timeout")
    .scan<'d', long>()
    .help("Default timeout per test case in milliseconds");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return false;
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  if (auto config_file = parser.present("--config")) {
    if (!LoadConfig(fs::path(*config_file), inv.config)) {
      spdlog::error("Failed to parse configuration file {}", *config_file);
      return false;
    }
  }
  if (auto val = parser.present<int>("--parallel")) {
    if (*val < 1) {
      spdlog::error("Invalid parallel value {}", *val);
      return false;
    }
    inv.config.max_parallel = *val;
  }
  if (auto val = parser.present<long>("--timeout")) {
    if (*val <= 0) {
      spdlog::error("Invalid timeout {}", *val);
      return false;
    }
    inv.config.timeout_ms = *val;
  }
  if (parser["--sandbox"] == true) inv.config.use_sandbox = true;
  if (auto val = parser.present("--backend")) {
    auto backend = GetSandboxBackend(*val);
    if (!backend) {
      spdlog::error("Unknown sandbox backend {}", *val);
      return false;
    }
    inv.config.sandbox_backend = *backend;
  }
  inv.language = parser.get<std::string>("--language");
  inv.source = parser.get<std::string>("--source");
  inv.tests = parser.get<std::string>("--tests");
  return true;
}

bool LoadTests(const fs::path& path, std::vector<TestCase>& tests) {
  std::string text;
  if (!ReadText(path, text)) {
    spdlog::error("Failed to read test file {}", path.c_str());
    return false;
  }
  try {
    auto json = nlohmann::json::parse(text);
    if (!json.is_array()) {
      spdlog::error("Test file {} is not a JSON array", path.c_str());
      return false;
    }
    for (auto& i : json) tests.push_back(TestCaseFromJson(i));
  } catch (const nlohmann::json::exception& e) {
    spdlog::error("Invalid test file {}: {}", path.c_str(), e.what());
    return false;
  } catch (const std::invalid_argument& e) {
    spdlog::error("Invalid test file {}: {}", path.c_str(), e.what());
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  // the sandbox helper may exit before reading its options
  signal(SIGPIPE, SIG_IGN);
  spdlog::set_pattern("[%t] %+");
  InitLogger();

  Invocation inv;
  if (!ParseArgs(argc, argv, inv)) return kExitError;
  std::string code;
  if (!ReadText(inv.source, code)) {
    spdlog::error("Failed to read source file {}", inv.source.c_str());
    return kExitError;
  }
  std::vector<TestCase> tests;
  if (!LoadTests(inv.tests, tests)) return kExitError;

  spdlog::info("Run: language={} tests={} sandbox={} timeout_ms={} max_parallel={}", inv.language, tests.size(),
               inv.config.use_sandbox ? SandboxBackendName(inv.config.sandbox_backend) : "none",
               inv.config.timeout_ms, inv.config.max_parallel);
  ExecutionEngine engine(inv.config);
  if (!engine.Initialize()) {
    spdlog::error("Failed to create scratch directory {}", inv.config.scratch_dir.c_str());
    return kExitError;
  }
  auto results = engine.ExecuteWithTests(code, inv.language, tests);

  nlohmann::json report = {
    {"language", inv.language},
    {"total", results.size()},
    {"results", nlohmann::json::array()},
  };
  size_t passed = 0;
  double points = 0, max_points = 0;
  for (size_t i = 0; i < results.size(); i++) {
    max_points += tests[i].points;
    if (results[i].passed) {
      passed++;
      points += tests[i].points;
    } else {
      spdlog::info("Test failed: id={} verdict={} error={}", results[i].test_case_id,
                   VerdictToDesc(results[i].verdict), results[i].error.value_or(""));
    }
    report["results"].push_back(TestCaseResultToJson(results[i]));
  }
  report["passed"] = passed;
  report["points"] = points;
  report["max_points"] = max_points;
  std::cout << report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  return passed == results.size() ? kExitAllPassed : kExitSomeFailed;
}
