#ifndef UTILS_H_
#define UTILS_H_

#include <string>
#include <filesystem>

#include <ibench/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm644 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::others_read;
constexpr fs::perms kPerm755 =
    fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;

fs::path InsideBox(const fs::path& box, const fs::path& path);

bool MountTmpfs(const fs::path&, long size_kib);
bool Umount(const fs::path&);
bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);
// read at most max_size bytes; truncated is set if the file is longer
bool ReadFile(const fs::path&, std::string& content, size_t max_size, bool* truncated = nullptr);

// strip leading and trailing whitespace (including newlines)
std::string Trim(const std::string&);

#endif  // UTILS_H_
