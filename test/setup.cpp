#include <signal.h>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <ibench/logger.h>
#include <ibench/paths.h>

#include "test_utils.h"

spdlog::level::level_enum log_level;

class IbenchEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    spdlog::set_pattern("[%P] %+");
    spdlog::set_level(log_level);
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(kTestScratch, ec);
  }
};

testing::Environment* const ibench_env = testing::AddGlobalTestEnvironment(new IbenchEnvironment);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  signal(SIGPIPE, SIG_IGN);
  InitLogger();
  if (argc) internal::kDataDir = fs::path(argv[0]).parent_path();
  log_level = spdlog::level::warn;
  if (argc > 1) {
    if (std::string("-v") == argv[1]) log_level = spdlog::level::info;
    if (std::string("-vv") == argv[1]) log_level = spdlog::level::debug;
  }
  return RUN_ALL_TESTS();
}
