#ifndef INCLUDE_IBENCH_ENGINE_H_
#define INCLUDE_IBENCH_ENGINE_H_

#include <string>
#include <vector>

#include "execution.h"

// The engine keeps no mutable state; a single instance can serve any number of
//   concurrent callers.
class ExecutionEngine {
  ExecutionConfig config_;
 public:
  ExecutionEngine() = default;
  explicit ExecutionEngine(const ExecutionConfig& config) : config_(config) {}

  const ExecutionConfig& Config() const { return config_; }

  // create the scratch directory; executions also create it lazily
  bool Initialize() const;

  TestCaseResult ExecuteTestCase(
      const std::string& code, const std::string& language, const TestCase& test_case,
      const ChallengeLimits& limits = {}, const CancelToken* cancel = nullptr) const;
  TestCaseResult ExecuteTestCase(
      const std::string& code, Language language, const TestCase& test_case,
      const ChallengeLimits& limits = {}, const CancelToken* cancel = nullptr) const;

  // results are in the order of test_cases regardless of max_parallel
  std::vector<TestCaseResult> ExecuteWithTests(
      const std::string& code, const std::string& language, const std::vector<TestCase>& test_cases,
      const ChallengeLimits& limits = {}, const CancelToken* cancel = nullptr) const;
  std::vector<TestCaseResult> ExecuteWithTests(
      const std::string& code, Language language, const std::vector<TestCase>& test_cases,
      const ChallengeLimits& limits = {}, const CancelToken* cancel = nullptr) const;
};

#endif  // INCLUDE_IBENCH_ENGINE_H_
