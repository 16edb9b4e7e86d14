#ifndef IBENCH_PATHS_H_
#define IBENCH_PATHS_H_

#include <string>

#include <ibench/paths.h>

// One box per execution:
//   <scratch>/<id>/            box root (read-only for the candidate)
//   <scratch>/<id>/workdir/    harness source, compiled program
extern const char kWorkdirRelative[];
fs::path Workdir(fs::path&&);

fs::path ExecutionBoxPath(const fs::path& scratch, const std::string& id);
fs::path ExecutionBoxWorkdir(const fs::path& scratch, const std::string& id);
fs::path ExecutionBoxSource(const fs::path& scratch, const std::string& id, const std::string& source_name);
fs::path ExecutionBoxProgram(const fs::path& scratch, const std::string& id, const std::string& program_name);

#endif  // IBENCH_PATHS_H_
