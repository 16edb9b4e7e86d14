#ifndef INCLUDE_IBENCH_EXECUTION_H_
#define INCLUDE_IBENCH_EXECUTION_H_

#include <atomic>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <unordered_map>

#include <nlohmann/json.hpp>

#define ENUM_LANGUAGE_ \
  X(TYPESCRIPT, "typescript") \
  X(JAVASCRIPT, "javascript") \
  X(PYTHON, "python") \
  X(JAVA, "java") \
  X(GO, "go") \
  X(RUST, "rust") \
  X(CSHARP, "csharp") \
  X(CPP, "cpp")
enum class Language {
#define X(name, langname) name,
  ENUM_LANGUAGE_
#undef X
};

// ordered roughly by how far the execution got; PASSED is the only passing verdict
#define ENUM_VERDICT_ \
  X(NUL, "", "nil") \
  X(PASSED, "AC", "Passed") \
  X(OUTPUT_MISMATCH, "WA", "Output Mismatch") \
  X(CANDIDATE_RUNTIME_ERROR, "CRE", "Candidate Runtime Error") \
  X(MALFORMED_OUTPUT, "MO", "Malformed Output") \
  X(TIMED_OUT, "TLE", "Timed Out") \
  X(RUN_FAILED, "RE", "Run Failed") \
  X(CANCELLED, "CXL", "Cancelled") \
  /* verdicts before execution */ \
  X(COMPILE_FAILED, "CE", "Compile Failed") \
  X(UNSUPPORTED_LANGUAGE, "UL", "Unsupported Language") \
  X(EXECUTION_ERROR, "EE", "Execution Error")
enum class Verdict {
#define X(name, abr, desc) name,
  ENUM_VERDICT_
#undef X
};

#define ENUM_SANDBOX_BACKEND_ \
  X(CONTAINER, "container") \
  X(JAIL, "jail")
enum class SandboxBackend {
#define X(name, backname) name,
  ENUM_SANDBOX_BACKEND_
#undef X
};

// Shared by all executions of a batch; Cancel() can be called from any thread
class CancelToken {
  std::atomic_bool cancelled_;
 public:
  CancelToken() : cancelled_(false) {}
  void Cancel() { cancelled_ = true; }
  bool IsCancelled() const { return cancelled_; }
};

struct TestCase {
  std::string id;
  std::string name;
  nlohmann::json input;
  // the literal `true` accepts any non-null result
  nlohmann::json expected_output;
  bool is_hidden;
  double points;
  std::optional<long> timeout_ms;
  std::optional<double> float_tolerance;

  TestCase() : is_hidden(false), points(0) {}
};

// challenge-level defaults, in the units of the challenge catalog
struct ChallengeLimits {
  std::optional<double> time_limit_s;
  std::optional<long> memory_limit_mb;
};

struct ExecutionResult {
  bool success;
  std::string stdout_str, stderr_str;
  int exit_code;
  int signal; // 0 if not killed by a signal
  long elapsed_ms;
  bool timed_out;
  bool cancelled;
  bool output_truncated;
  std::optional<long> memory_usage; // bytes, peak RSS
  std::optional<std::string> error;

  ExecutionResult() :
      success(false), exit_code(1), signal(0), elapsed_ms(0),
      timed_out(false), cancelled(false), output_truncated(false) {}
};

struct TestCaseResult {
  std::string test_case_id;
  bool passed;
  Verdict verdict;
  std::optional<nlohmann::json> actual_output;
  nlohmann::json expected_output;
  std::optional<std::string> error;
  long elapsed_ms; // run phase only
  long compile_ms;
  // raw run-phase metadata; default-constructed if the run phase never started
  ExecutionResult execution;

  TestCaseResult() : passed(false), verdict(Verdict::NUL), elapsed_ms(0), compile_ms(0) {}
};

struct ExecutionConfig {
  long timeout_ms;
  long memory_limit; // bytes
  std::filesystem::path scratch_dir;
  bool use_sandbox;
  SandboxBackend sandbox_backend;
  // container startup/teardown allowance added on top of the timeout
  long sandbox_overhead_ms;
  std::string docker_binary;
  std::unordered_map<Language, std::string> container_images; // overrides profile defaults
  int max_parallel;
  double float_tolerance;
  long max_output; // bytes per stream
  std::vector<std::string> cpp_include_dirs;

  ExecutionConfig();
};

#endif  // INCLUDE_IBENCH_EXECUTION_H_
