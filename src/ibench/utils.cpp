#include "utils.h"

#include <sys/mount.h>
#include <random>
#include <cstring>
#include <fstream>
#include <stdexcept>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

std::string GetUniqueExecutionId() {
  // UUID version 4; ids must stay unique across processes sharing a scratch directory
  thread_local std::mt19937_64 gen([]() {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
  }());
  uint64_t hi = gen(), lo = gen();
  hi = (hi & ~0xf000ULL) | 0x4000ULL;
  lo = (lo & ~(0xc000ULL << 48)) | (0x8000ULL << 48);
  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                     hi >> 32, (hi >> 16) & 0xffff, hi & 0xffff,
                     lo >> 48, lo & 0xffffffffffffULL);
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG3(Verdict, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* VerdictToDesc, Verdict, ENUM_VERDICT_)
#undef X

#define X(...) X_RETURN_ARG2(SandboxBackend, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SandboxBackendName, SandboxBackend, ENUM_SANDBOX_BACKEND_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

static const char* kVerdictAbrTable[] = {
#define X(name, abr, desc) abr,
  ENUM_VERDICT_
#undef X
};

const char* VerdictToAbr(Verdict verdict) {
  return kVerdictAbrTable[(int)verdict];
}

static const char* kLanguageNameTable[] = {
#define X(name, langname) langname,
  ENUM_LANGUAGE_
#undef X
};

const char* LanguageName(Language lang) {
  return kLanguageNameTable[(int)lang];
}

std::optional<Language> GetLanguage(const std::string& str) {
  for (size_t i = 0; i < sizeof(kLanguageNameTable) / sizeof(kLanguageNameTable[0]); i++) {
    if (str == kLanguageNameTable[i]) return (Language)i;
  }
  return std::nullopt;
}

std::optional<SandboxBackend> GetSandboxBackend(const std::string& str) {
#define X(name, backname) if (str == backname) return SandboxBackend::name;
  ENUM_SANDBOX_BACKEND_
#undef X
  return std::nullopt;
}

TestCase TestCaseFromJson(const nlohmann::json& json) {
  TestCase ret;
  ret.id = json.at("id").get<std::string>();
  ret.name = json.value("name", ret.id);
  if (auto it = json.find("input"); it != json.end()) ret.input = *it;
  if (auto it = json.find("expectedOutput"); it != json.end()) ret.expected_output = *it;
  ret.is_hidden = json.value("isHidden", false);
  ret.points = json.value("points", 0.0);
  if (auto it = json.find("timeout"); it != json.end() && !it->is_null()) {
    ret.timeout_ms = it->get<long>();
    if (*ret.timeout_ms <= 0) {
      throw std::invalid_argument("timeout of test " + ret.id + " must be positive");
    }
  }
  if (auto it = json.find("floatTolerance"); it != json.end() && !it->is_null()) {
    ret.float_tolerance = it->get<double>();
  }
  return ret;
}

nlohmann::json TestCaseResultToJson(const TestCaseResult& res) {
  nlohmann::json ret = {
    {"testCaseId", res.test_case_id},
    {"passed", res.passed},
    {"verdict", VerdictToAbr(res.verdict)},
    {"expectedOutput", res.expected_output},
    {"executionTime", res.elapsed_ms},
    {"compileTime", res.compile_ms},
    {"exitCode", res.execution.exit_code},
    {"timedOut", res.execution.timed_out},
  };
  if (res.actual_output) ret["actualOutput"] = *res.actual_output;
  if (res.error) ret["error"] = *res.error;
  if (res.execution.memory_usage) ret["memoryUsage"] = *res.execution.memory_usage;
  return ret;
}

fs::path InsideBox(const fs::path& box, const fs::path& path) {
  return "/" / path.lexically_relative(box);
}

bool MountTmpfs(const fs::path& path, long size_kib) {
  spdlog::debug("Mount tmpfs on {}, size {}", path.c_str(), size_kib);
  bool ret = 0 == mount("tmpfs", path.c_str(), "tmpfs", 0,
                        ("size=" + std::to_string(size_kib) + 'k').c_str());
  if (!ret) spdlog::warn("Failed mounting tmpfs on {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool Umount(const fs::path& path) {
  spdlog::debug("Umount {}", path.c_str());
  bool ret = 0 == umount(path.c_str());
  if (!ret) spdlog::warn("Failed unmounting {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, size {}", path.c_str(), content.size());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size())) goto err_stream;
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permissions of {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
err_stream:
  spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
  return false;
}

bool ReadFile(const fs::path& path, std::string& content, size_t max_size, bool* truncated) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return false;
  content.assign(max_size, '\0');
  fin.read(content.data(), max_size);
  content.resize(fin.gcount());
  if (truncated) *truncated = fin.peek() != std::ifstream::traits_type::eof();
  return true;
}

std::string Trim(const std::string& str) {
  size_t l = str.find_first_not_of(" \t\r\n");
  if (l == std::string::npos) return "";
  size_t r = str.find_last_not_of(" \t\r\n");
  return str.substr(l, r - l + 1);
}
