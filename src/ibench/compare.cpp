#include "compare.h"

#include <cmath>

#include <spdlog/spdlog.h>

#include "utils.h"

namespace {

const char kMalformedOutput[] = "Failed to parse execution output";

} // namespace

bool JsonEqual(const nlohmann::json& a, const nlohmann::json& b, double tolerance) {
  if (a.is_number() && b.is_number()) {
    if (a.is_number_float() || b.is_number_float()) {
      double x = a.get<double>(), y = b.get<double>();
      if (x == y) return true;
      return tolerance > 0 && std::fabs(x - y) <= tolerance;
    }
    // integer against integer, signed or not
    return a == b;
  }
  if (a.type() != b.type()) return false;
  switch (a.type()) {
    case nlohmann::json::value_t::array: {
      if (a.size() != b.size()) return false;
      for (size_t i = 0; i < a.size(); i++) {
        if (!JsonEqual(a[i], b[i], tolerance)) return false;
      }
      return true;
    }
    case nlohmann::json::value_t::object: {
      if (a.size() != b.size()) return false;
      for (auto it = a.begin(); it != a.end(); ++it) {
        auto jt = b.find(it.key());
        if (jt == b.end() || !JsonEqual(it.value(), *jt, tolerance)) return false;
      }
      return true;
    }
    default:
      return a == b;
  }
}

bool CompareOutput(const std::optional<nlohmann::json>& actual,
                   const nlohmann::json& expected, double tolerance) {
  if (expected.is_boolean() && expected.get<bool>()) {
    return actual && !actual->is_null();
  }
  if (!actual) return false;
  return JsonEqual(*actual, expected, tolerance);
}

std::optional<std::string> ResultLine(const std::string& stdout_str) {
  size_t end = stdout_str.size();
  while (end > 0) {
    size_t begin = stdout_str.rfind('\n', end - 1);
    begin = begin == std::string::npos ? 0 : begin + 1;
    std::string line = Trim(stdout_str.substr(begin, end - begin));
    if (!line.empty()) return line;
    if (begin == 0) break;
    end = begin - 1;
  }
  return std::nullopt;
}

TestCaseResult ParseExecutionResult(const ExecutionResult& exec, const TestCase& test_case, double tolerance) {
  TestCaseResult ret;
  ret.test_case_id = test_case.id;
  ret.expected_output = test_case.expected_output;
  ret.elapsed_ms = exec.elapsed_ms;
  ret.execution = exec;

  if (!exec.success) {
    if (exec.timed_out) {
      ret.verdict = Verdict::TIMED_OUT;
    } else if (exec.cancelled) {
      ret.verdict = Verdict::CANCELLED;
    } else {
      ret.verdict = Verdict::RUN_FAILED;
    }
    ret.error = exec.error ? *exec.error : Trim(exec.stderr_str);
    return ret;
  }

  auto line = ResultLine(exec.stdout_str);
  nlohmann::json output;
  if (line) output = nlohmann::json::parse(*line, nullptr, false);
  if (!line || output.is_discarded() || !output.is_object() ||
      !output.contains("success") || !output["success"].is_boolean()) {
    spdlog::debug("Malformed output: test={} stdout_size={}", test_case.id, exec.stdout_str.size());
    ret.verdict = Verdict::MALFORMED_OUTPUT;
    ret.error = kMalformedOutput;
    ret.actual_output = exec.stdout_str;
    return ret;
  }

  if (!output["success"].get<bool>()) {
    ret.verdict = Verdict::CANDIDATE_RUNTIME_ERROR;
    auto it = output.find("error");
    if (it == output.end() || it->is_null()) {
      ret.error = "Unknown error";
    } else if (it->is_string()) {
      ret.error = it->get<std::string>();
    } else {
      ret.error = it->dump();
    }
    return ret;
  }

  if (auto it = output.find("result"); it != output.end()) ret.actual_output = *it;
  ret.passed = CompareOutput(ret.actual_output, test_case.expected_output, tolerance);
  ret.verdict = ret.passed ? Verdict::PASSED : Verdict::OUTPUT_MISMATCH;
  return ret;
}
