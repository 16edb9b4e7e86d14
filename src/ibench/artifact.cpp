#include "artifact.h"

#include <spdlog/spdlog.h>

#include "paths.h"
#include "utils.h"

ExecutionArtifact::ExecutionArtifact(const fs::path& scratch) :
    id_(GetUniqueExecutionId()), scratch_(scratch), ready_(false) {
  // the sandbox user has to traverse the box but never writes to it
  ready_ = CreateDirs(ExecutionBoxPath(scratch_, id_), kPerm755) &&
           CreateDirs(ExecutionBoxWorkdir(scratch_, id_), kPerm755);
}

ExecutionArtifact::~ExecutionArtifact() {
  if (!RemoveAll(ExecutionBoxPath(scratch_, id_))) {
    spdlog::error("Failed to clean up execution box: id={}", id_);
  }
}

fs::path ExecutionArtifact::Box() const {
  return ExecutionBoxPath(scratch_, id_);
}

fs::path ExecutionArtifact::Workdir() const {
  return ExecutionBoxWorkdir(scratch_, id_);
}

fs::path ExecutionArtifact::Source(const LanguageProfile& profile) const {
  return ExecutionBoxSource(scratch_, id_, profile.SourceName());
}

fs::path ExecutionArtifact::Program(const LanguageProfile& profile) const {
  return ExecutionBoxProgram(scratch_, id_, profile.ProgramName());
}
