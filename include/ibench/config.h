#ifndef INCLUDE_IBENCH_CONFIG_H_
#define INCLUDE_IBENCH_CONFIG_H_

#include <istream>
#include <filesystem>

#include "execution.h"

// Keys absent from the file keep the value already in config.
// Returns false if the file cannot be opened or a value is invalid.
bool LoadConfig(const std::filesystem::path& path, ExecutionConfig& config);
bool LoadConfig(std::istream& in, ExecutionConfig& config);

#endif  // INCLUDE_IBENCH_CONFIG_H_
