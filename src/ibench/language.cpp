#include "language.h"

#include "harness.h"
#include "utils.h"

namespace {

class TypeScriptProfile : public LanguageProfile {
 public:
  Language Lang() const override { return Language::TYPESCRIPT; }
  const char* Extension() const override { return ".ts"; }
  std::string SourceName() const override { return "solution.ts"; }
  std::vector<std::string> RunCommand(const fs::path& program) const override {
    return {"npx", "--no-install", "tsx", program};
  }
  std::string Harness(const std::string& code, const nlohmann::json& input) const override {
    return ScriptHarness(code, input, true);
  }
  const char* DefaultImage() const override { return "node:20-alpine"; }
};

class JavaScriptProfile : public LanguageProfile {
 public:
  Language Lang() const override { return Language::JAVASCRIPT; }
  const char* Extension() const override { return ".js"; }
  std::string SourceName() const override { return "solution.js"; }
  std::vector<std::string> RunCommand(const fs::path& program) const override {
    return {"node", program};
  }
  std::string Harness(const std::string& code, const nlohmann::json& input) const override {
    return ScriptHarness(code, input, false);
  }
  const char* DefaultImage() const override { return "node:20-alpine"; }
};

class PythonProfile : public LanguageProfile {
 public:
  Language Lang() const override { return Language::PYTHON; }
  const char* Extension() const override { return ".py"; }
  std::string SourceName() const override { return "solution.py"; }
  std::vector<std::string> RunCommand(const fs::path& program) const override {
    return {"python3", program};
  }
  std::string Harness(const std::string& code, const nlohmann::json& input) const override {
    return PythonHarness(code, input);
  }
  const char* DefaultImage() const override { return "python:3.12-alpine"; }
};

class JavaProfile : public LanguageProfile {
 public:
  Language Lang() const override { return Language::JAVA; }
  const char* Extension() const override { return ".java"; }
  // javac requires the public class to match the file name
  std::string SourceName() const override { return "Solution.java"; }
  std::string ProgramName() const override { return "classes"; }
  bool ProgramIsDirectory() const override { return true; }
  bool HasCompileStep() const override { return true; }
  std::vector<std::string> CompileCommand(
      const fs::path& source, const fs::path& program, const ExecutionConfig&) const override {
    return {"javac", "-encoding", "UTF-8", "-d", program, source};
  }
  std::vector<std::string> RunCommand(const fs::path& program) const override {
    return {"java", "-cp", program, "Solution"};
  }
  std::string Harness(const std::string& code, const nlohmann::json& input) const override {
    return JavaHarness(code, input);
  }
  const char* DefaultImage() const override { return "openjdk:21-slim"; }
};

class GoProfile : public LanguageProfile {
 public:
  Language Lang() const override { return Language::GO; }
  const char* Extension() const override { return ".go"; }
  std::string SourceName() const override { return "solution.go"; }
  std::string ProgramName() const override { return "solution"; }
  bool HasCompileStep() const override { return true; }
  std::vector<std::string> CompileCommand(
      const fs::path& source, const fs::path& program, const ExecutionConfig&) const override {
    return {"go", "build", "-o", program, source};
  }
  std::vector<std::string> RunCommand(const fs::path& program) const override {
    return {program};
  }
  std::string Harness(const std::string& code, const nlohmann::json& input) const override {
    return GoHarness(code, input);
  }
  const char* DefaultImage() const override { return "golang:1.22"; }
};

class RustProfile : public LanguageProfile {
 public:
  Language Lang() const override { return Language::RUST; }
  const char* Extension() const override { return ".rs"; }
  std::string SourceName() const override { return "solution.rs"; }
  std::string ProgramName() const override { return "solution"; }
  bool HasCompileStep() const override { return true; }
  std::vector<std::string> CompileCommand(
      const fs::path& source, const fs::path& program, const ExecutionConfig&) const override {
    return {"rustc", "--edition", "2021", "-O", "-o", program, source};
  }
  std::vector<std::string> RunCommand(const fs::path& program) const override {
    return {program};
  }
  std::string Harness(const std::string& code, const nlohmann::json& input) const override {
    return RustHarness(code, input);
  }
  const char* DefaultImage() const override { return "rust:1.75-slim"; }
};

class CSharpProfile : public LanguageProfile {
 public:
  Language Lang() const override { return Language::CSHARP; }
  const char* Extension() const override { return ".cs"; }
  std::string SourceName() const override { return "solution.cs"; }
  std::string ProgramName() const override { return "solution.exe"; }
  bool HasCompileStep() const override { return true; }
  std::vector<std::string> CompileCommand(
      const fs::path& source, const fs::path& program, const ExecutionConfig&) const override {
    return {"mcs", "-main:Program", "-out:" + program.string(), source};
  }
  std::vector<std::string> RunCommand(const fs::path& program) const override {
    return {"mono", program};
  }
  std::string Harness(const std::string& code, const nlohmann::json& input) const override {
    return CSharpHarness(code, input);
  }
  const char* DefaultImage() const override { return "mono:6.12"; }
};

class CppProfile : public LanguageProfile {
 public:
  Language Lang() const override { return Language::CPP; }
  const char* Extension() const override { return ".cpp"; }
  std::string SourceName() const override { return "solution.cpp"; }
  std::string ProgramName() const override { return "solution"; }
  bool HasCompileStep() const override { return true; }
  std::vector<std::string> CompileCommand(
      const fs::path& source, const fs::path& program, const ExecutionConfig& config) const override {
    std::vector<std::string> ret = {"g++", "-std=c++17", "-O2"};
    for (auto& i : config.cpp_include_dirs) ret.push_back("-I" + i);
    ret.insert(ret.end(), {"-o", program, source});
    return ret;
  }
  std::vector<std::string> RunCommand(const fs::path& program) const override {
    return {program};
  }
  std::string Harness(const std::string& code, const nlohmann::json& input) const override {
    return CppHarness(code, input);
  }
  const char* DefaultImage() const override { return "gcc:13"; }
};

const TypeScriptProfile kTypeScript{};
const JavaScriptProfile kJavaScript{};
const PythonProfile kPython{};
const JavaProfile kJava{};
const GoProfile kGo{};
const RustProfile kRust{};
const CSharpProfile kCSharp{};
const CppProfile kCpp{};

} // namespace

std::string LanguageProfile::ContainerImage(const ExecutionConfig& config) const {
  auto it = config.container_images.find(Lang());
  if (it != config.container_images.end() && !it->second.empty()) return it->second;
  return DefaultImage();
}

const LanguageProfile* ProfileFor(Language lang) {
  switch (lang) {
    case Language::TYPESCRIPT: return &kTypeScript;
    case Language::JAVASCRIPT: return &kJavaScript;
    case Language::PYTHON: return &kPython;
    case Language::JAVA: return &kJava;
    case Language::GO: return &kGo;
    case Language::RUST: return &kRust;
    case Language::CSHARP: return &kCSharp;
    case Language::CPP: return &kCpp;
  }
  return nullptr;
}

const LanguageProfile* ProfileFor(const std::string& name) {
  auto lang = GetLanguage(name);
  if (!lang) return nullptr;
  return ProfileFor(*lang);
}
