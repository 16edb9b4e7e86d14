#ifndef IBENCH_COMPARE_H_
#define IBENCH_COMPARE_H_

#include <optional>

#include <nlohmann/json.hpp>
#include <ibench/execution.h>

// Deep structural equality: arrays in order, objects by key set (order
//   irrelevant), numbers by value (|a - b| <= tolerance), other scalars exactly.
bool JsonEqual(const nlohmann::json& a, const nlohmann::json& b, double tolerance = 0);

// expected == true accepts any present non-null actual value
bool CompareOutput(const std::optional<nlohmann::json>& actual,
                   const nlohmann::json& expected, double tolerance = 0);

// the result line is the last non-empty line of stdout; nullopt if there is none
std::optional<std::string> ResultLine(const std::string& stdout_str);

// Turns a finished run into the test verdict. Never throws on bad output.
TestCaseResult ParseExecutionResult(const ExecutionResult&, const TestCase&, double tolerance);

#endif  // IBENCH_COMPARE_H_
