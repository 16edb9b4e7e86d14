#include <ibench/engine.h>

#include <atomic>
#include <thread>
#include <algorithm>

#include <spdlog/spdlog.h>

#include "executor.h"
#include "language.h"
#include "pipeline.h"
#include "utils.h"

namespace {

TestCaseResult FailedResult(const TestCase& test_case, Verdict verdict, const std::string& error) {
  TestCaseResult ret;
  ret.test_case_id = test_case.id;
  ret.expected_output = test_case.expected_output;
  ret.verdict = verdict;
  ret.error = error;
  ret.execution.stderr_str = error;
  ret.execution.error = error;
  return ret;
}

TestCaseResult CancelledResult(const TestCase& test_case) {
  TestCaseResult ret = FailedResult(test_case, Verdict::CANCELLED, "Execution cancelled");
  ret.execution.cancelled = true;
  return ret;
}

TestCaseResult Execute(const LanguageProfile& profile, const std::string& code, const TestCase& test_case,
                       const ChallengeLimits& limits, const ExecutionConfig& config,
                       const Executor& executor, const CancelToken* cancel) {
  if (cancel && cancel->IsCancelled()) return CancelledResult(test_case);
  try {
    return RunPipeline(profile, code, test_case, limits, config, executor, cancel);
  } catch (const std::exception& e) {
    // the box is already gone; only the report is left to make
    spdlog::error("Execution error: test={} language={} error={}",
                  test_case.id, LanguageName(profile.Lang()), e.what());
    return FailedResult(test_case, Verdict::EXECUTION_ERROR, e.what());
  }
}

std::string UnsupportedMessage(const std::string& language) {
  return "Unsupported language: " + language;
}

} // namespace

bool ExecutionEngine::Initialize() const {
  return CreateDirs(config_.scratch_dir);
}

TestCaseResult ExecutionEngine::ExecuteTestCase(
    const std::string& code, const std::string& language, const TestCase& test_case,
    const ChallengeLimits& limits, const CancelToken* cancel) const {
  auto lang = GetLanguage(language);
  if (!lang) {
    spdlog::info("Unsupported language: test={} language={}", test_case.id, language);
    return FailedResult(test_case, Verdict::UNSUPPORTED_LANGUAGE, UnsupportedMessage(language));
  }
  return ExecuteTestCase(code, *lang, test_case, limits, cancel);
}

TestCaseResult ExecutionEngine::ExecuteTestCase(
    const std::string& code, Language language, const TestCase& test_case,
    const ChallengeLimits& limits, const CancelToken* cancel) const {
  const LanguageProfile* profile = ProfileFor(language);
  if (!profile) {
    return FailedResult(test_case, Verdict::UNSUPPORTED_LANGUAGE, UnsupportedMessage(LanguageName(language)));
  }
  auto executor = MakeExecutor(config_);
  return Execute(*profile, code, test_case, limits, config_, *executor, cancel);
}

std::vector<TestCaseResult> ExecutionEngine::ExecuteWithTests(
    const std::string& code, const std::string& language, const std::vector<TestCase>& test_cases,
    const ChallengeLimits& limits, const CancelToken* cancel) const {
  auto lang = GetLanguage(language);
  if (!lang) {
    spdlog::info("Unsupported language: language={} tests={}", language, test_cases.size());
    std::vector<TestCaseResult> ret;
    for (auto& i : test_cases) {
      ret.push_back(FailedResult(i, Verdict::UNSUPPORTED_LANGUAGE, UnsupportedMessage(language)));
    }
    return ret;
  }
  return ExecuteWithTests(code, *lang, test_cases, limits, cancel);
}

std::vector<TestCaseResult> ExecutionEngine::ExecuteWithTests(
    const std::string& code, Language language, const std::vector<TestCase>& test_cases,
    const ChallengeLimits& limits, const CancelToken* cancel) const {
  std::vector<TestCaseResult> ret(test_cases.size());
  const LanguageProfile* profile = ProfileFor(language);
  if (!profile) {
    for (size_t i = 0; i < test_cases.size(); i++) {
      ret[i] = FailedResult(test_cases[i], Verdict::UNSUPPORTED_LANGUAGE,
                            UnsupportedMessage(LanguageName(language)));
    }
    return ret;
  }
  auto executor = MakeExecutor(config_);

  // each worker claims the next index; results land in their own slot
  std::atomic<size_t> next(0);
  auto Worker = [&]() {
    for (size_t i; (i = next++) < test_cases.size();) {
      ret[i] = Execute(*profile, code, test_cases[i], limits, config_, *executor, cancel);
    }
  };
  size_t workers = std::min<size_t>(std::max(config_.max_parallel, 1), test_cases.size());
  spdlog::info("Batch started: language={} tests={} workers={}",
               LanguageName(language), test_cases.size(), workers);
  if (workers <= 1) {
    Worker();
  } else {
    std::vector<std::thread> threads;
    for (size_t i = 0; i < workers; i++) threads.emplace_back(Worker);
    for (auto& i : threads) i.join();
  }

  size_t passed = std::count_if(ret.begin(), ret.end(), [](const TestCaseResult& res) { return res.passed; });
  spdlog::info("Batch finished: language={} passed={}/{}", LanguageName(language), passed, ret.size());
  return ret;
}
