#ifndef IBENCH_ARTIFACT_H_
#define IBENCH_ARTIFACT_H_

#include <string>
#include <filesystem>

#include "language.h"

// The per-execution box <scratch>/<uuid>. Created on construction and removed
//   when the object goes out of scope, whichever way the execution ends.
class ExecutionArtifact {
  std::string id_;
  fs::path scratch_;
  bool ready_;
 public:
  explicit ExecutionArtifact(const fs::path& scratch);
  ~ExecutionArtifact();
  ExecutionArtifact(const ExecutionArtifact&) = delete;
  ExecutionArtifact& operator=(const ExecutionArtifact&) = delete;

  // false if the box could not be created
  bool Ready() const { return ready_; }
  const std::string& Id() const { return id_; }

  fs::path Box() const;
  fs::path Workdir() const;
  fs::path Source(const LanguageProfile&) const;
  fs::path Program(const LanguageProfile&) const;
};

#endif  // IBENCH_ARTIFACT_H_
