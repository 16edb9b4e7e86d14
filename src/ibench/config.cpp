#include <ibench/config.h>

#include <fstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <ibench/paths.h>
#include "utils.h"

ExecutionConfig::ExecutionConfig() :
    timeout_ms(10000),
    memory_limit(256L << 20),
    scratch_dir(kScratchRoot),
    use_sandbox(false),
    sandbox_backend(SandboxBackend::CONTAINER),
    sandbox_overhead_ms(5000),
    docker_binary("docker"),
    max_parallel(1),
    float_tolerance(0),
    max_output(16L << 20) {}

namespace {

std::vector<std::string> SplitList(const std::string& str) {
  std::vector<std::string> ret;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t nxt = str.find(',', pos);
    if (nxt == std::string::npos) nxt = str.size();
    size_t l = str.find_first_not_of(" \t", pos);
    size_t r = str.find_last_not_of(" \t", nxt - 1);
    if (l != std::string::npos && l < nxt && r != std::string::npos && r >= l) {
      ret.push_back(str.substr(l, r - l + 1));
    }
    pos = nxt + 1;
  }
  return ret;
}

} // namespace

bool LoadConfig(std::istream& in, ExecutionConfig& config) {
  tortellini::ini ini;
  in >> ini;
  auto root = ini[""];

  std::string scratch_dir = root["scratch_dir"] | "";
  if (scratch_dir.size()) config.scratch_dir = scratch_dir;
  config.timeout_ms = root["timeout_ms"] | config.timeout_ms;
  config.memory_limit = (root["memory_limit_mb"] | (config.memory_limit >> 20)) * (1L << 20);
  config.use_sandbox = root["use_sandbox"] | config.use_sandbox;
  config.sandbox_overhead_ms = root["sandbox_overhead_ms"] | config.sandbox_overhead_ms;
  config.docker_binary = root["docker_binary"] | config.docker_binary;
  config.max_parallel = root["max_parallel"] | config.max_parallel;
  config.float_tolerance = root["float_tolerance"] | config.float_tolerance;
  config.max_output = (root["max_output_kib"] | (config.max_output >> 10)) * (1L << 10);
  std::string include_dirs = root["cpp_include_dirs"] | "";
  if (include_dirs.size()) config.cpp_include_dirs = SplitList(include_dirs);

  std::string backend = root["sandbox_backend"] | "";
  if (backend.size()) {
    auto val = GetSandboxBackend(backend);
    if (!val) {
      spdlog::error("Invalid sandbox_backend: {}", backend);
      return false;
    }
    config.sandbox_backend = *val;
  }

  auto images = ini["images"];
#define X(name, langname) \
  if (std::string image = images[langname] | ""; image.size()) config.container_images[Language::name] = image;
  ENUM_LANGUAGE_
#undef X

  if (config.timeout_ms <= 0 || config.memory_limit <= 0 || config.max_parallel <= 0 ||
      config.sandbox_overhead_ms < 0 || config.float_tolerance < 0 || config.max_output <= 0) {
    spdlog::error("Invalid configuration: timeout_ms={} memory_limit={} max_parallel={} "
                  "sandbox_overhead_ms={} float_tolerance={} max_output={}",
                  config.timeout_ms, config.memory_limit, config.max_parallel,
                  config.sandbox_overhead_ms, config.float_tolerance, config.max_output);
    return false;
  }
  return true;
}

bool LoadConfig(const fs::path& path, ExecutionConfig& config) {
  std::ifstream fin(path);
  if (!fin) {
    spdlog::error("Failed to open configuration file {}", path.c_str());
    return false;
  }
  return LoadConfig(fin, config);
}
