#ifndef IBENCH_HARNESS_H_
#define IBENCH_HARNESS_H_

#include <string>

#include <nlohmann/json.hpp>
#include <ibench/execution.h>

// Each harness embeds the candidate source verbatim, invokes its entry point on
//   the embedded input and prints exactly one line to stdout:
//   {"success":true,"result":...} or {"success":false,"error":"..."}

// Body (without the surrounding quotes) of a double-quoted string literal of lang.
// Invalid UTF-8 is replaced by U+FFFD, except for C++, where bytes are kept.
std::string EscapeStringLiteral(const std::string& str, Language lang);

// ASCII-only compact JSON text; invalid UTF-8 in strings is replaced
std::string AsciiJson(const nlohmann::json&);

// JavaScript and TypeScript share one template
std::string ScriptHarness(const std::string& code, const nlohmann::json& input, bool typescript);
std::string PythonHarness(const std::string& code, const nlohmann::json& input);
std::string GoHarness(const std::string& code, const nlohmann::json& input);
std::string CppHarness(const std::string& code, const nlohmann::json& input);
// inputs become native literals
std::string JavaHarness(const std::string& code, const nlohmann::json& input);
std::string CSharpHarness(const std::string& code, const nlohmann::json& input);
std::string RustHarness(const std::string& code, const nlohmann::json& input);

#endif  // IBENCH_HARNESS_H_
