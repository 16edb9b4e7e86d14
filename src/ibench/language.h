#ifndef IBENCH_LANGUAGE_H_
#define IBENCH_LANGUAGE_H_

#include <string>
#include <vector>
#include <filesystem>

#include <ibench/execution.h>

namespace fs = std::filesystem;

// Immutable per-language metadata. One instance per language lives in a fixed
//   registry and is shared by all executions.
class LanguageProfile {
 public:
  virtual ~LanguageProfile() = default;

  virtual Language Lang() const = 0;
  virtual const char* Extension() const = 0;
  // file name of the harness inside the box workdir
  virtual std::string SourceName() const = 0;
  // what RunCommand receives; the source itself for interpreted languages
  virtual std::string ProgramName() const { return SourceName(); }
  // the compiler writes a directory instead of a file (created beforehand)
  virtual bool ProgramIsDirectory() const { return false; }

  virtual bool HasCompileStep() const { return false; }
  virtual std::vector<std::string> CompileCommand(
      const fs::path& /*source*/, const fs::path& /*program*/, const ExecutionConfig&) const {
    return {};
  }
  virtual std::vector<std::string> RunCommand(const fs::path& program) const = 0;

  virtual std::string Harness(const std::string& code, const nlohmann::json& input) const = 0;
  virtual const char* DefaultImage() const = 0;

  std::string ContainerImage(const ExecutionConfig&) const;
};

// nullptr if the language is not supported
const LanguageProfile* ProfileFor(Language);
const LanguageProfile* ProfileFor(const std::string&);

#endif  // IBENCH_LANGUAGE_H_
