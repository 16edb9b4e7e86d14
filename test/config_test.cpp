#include <sstream>

#include <gtest/gtest.h>
#include <ibench/config.h>

#include "test_utils.h"

namespace {

bool Load(const std::string& text, ExecutionConfig& config) {
  std::istringstream in(text);
  return LoadConfig(in, config);
}

} // namespace

TEST(ConfigTest, Defaults) {
  ExecutionConfig config;
  EXPECT_EQ(config.timeout_ms, 10000);
  EXPECT_EQ(config.memory_limit, 256L << 20);
  EXPECT_FALSE(config.use_sandbox);
  EXPECT_EQ(config.sandbox_backend, SandboxBackend::CONTAINER);
  EXPECT_EQ(config.sandbox_overhead_ms, 5000);
  EXPECT_EQ(config.docker_binary, "docker");
  EXPECT_EQ(config.max_parallel, 1);
  EXPECT_EQ(config.float_tolerance, 0);
  EXPECT_TRUE(config.container_images.empty());
}

TEST(ConfigTest, EmptyFileKeepsValues) {
  ExecutionConfig config = TestConfig(1234);
  ASSERT_TRUE(Load("", config));
  EXPECT_EQ(config.timeout_ms, 1234);
  EXPECT_EQ(config.scratch_dir, kTestScratch);
}

TEST(ConfigTest, AllKeys) {
  ExecutionConfig config;
  ASSERT_TRUE(Load(R"(
scratch_dir = /var/tmp/ibench
timeout_ms = 2500
memory_limit_mb = 128
use_sandbox = true
sandbox_backend = jail
sandbox_overhead_ms = 1000
docker_binary = podman
max_parallel = 4
float_tolerance = 0.001
max_output_kib = 64
cpp_include_dirs = /opt/json/include, /usr/include

[images]
python = python:3.11-slim
cpp = gcc:12
)", config));
  EXPECT_EQ(config.scratch_dir, fs::path("/var/tmp/ibench"));
  EXPECT_EQ(config.timeout_ms, 2500);
  EXPECT_EQ(config.memory_limit, 128L << 20);
  EXPECT_TRUE(config.use_sandbox);
  EXPECT_EQ(config.sandbox_backend, SandboxBackend::JAIL);
  EXPECT_EQ(config.sandbox_overhead_ms, 1000);
  EXPECT_EQ(config.docker_binary, "podman");
  EXPECT_EQ(config.max_parallel, 4);
  EXPECT_DOUBLE_EQ(config.float_tolerance, 0.001);
  EXPECT_EQ(config.max_output, 64L << 10);
  EXPECT_EQ(config.cpp_include_dirs, (std::vector<std::string>{"/opt/json/include", "/usr/include"}));
  ASSERT_EQ(config.container_images.size(), 2u);
  EXPECT_EQ(config.container_images[Language::PYTHON], "python:3.11-slim");
  EXPECT_EQ(config.container_images[Language::CPP], "gcc:12");
}

TEST(ConfigTest, InvalidBackend) {
  ExecutionConfig config;
  EXPECT_FALSE(Load("sandbox_backend = vm\n", config));
}

TEST(ConfigTest, InvalidRanges) {
  ExecutionConfig config;
  EXPECT_FALSE(Load("timeout_ms = 0\n", config));
  config = ExecutionConfig();
  EXPECT_FALSE(Load("max_parallel = 0\n", config));
  config = ExecutionConfig();
  EXPECT_FALSE(Load("float_tolerance = -1\n", config));
  config = ExecutionConfig();
  EXPECT_FALSE(Load("memory_limit_mb = -4\n", config));
  config = ExecutionConfig();
  EXPECT_FALSE(Load("max_output_kib = -1\n", config));
}

TEST(ConfigTest, MissingFile) {
  ExecutionConfig config;
  EXPECT_FALSE(LoadConfig(fs::path("/nonexistent/ibench.conf"), config));
}
