#ifndef IBENCH_UTILS_H_
#define IBENCH_UTILS_H_

#include <string>
#include <optional>

#include "execution.h"

std::string GetUniqueExecutionId();

const char* VerdictToDesc(Verdict);
const char* VerdictToAbr(Verdict);

const char* LanguageName(Language);
std::optional<Language> GetLanguage(const std::string&);

const char* SandboxBackendName(SandboxBackend);
std::optional<SandboxBackend> GetSandboxBackend(const std::string&);

// JSON forms use the field names of the challenge catalog (camelCase)
// throws nlohmann::json::exception if a required field is missing or mistyped,
//   std::invalid_argument if the timeout is not positive
TestCase TestCaseFromJson(const nlohmann::json&);
nlohmann::json TestCaseResultToJson(const TestCaseResult&);

#endif  // IBENCH_UTILS_H_
