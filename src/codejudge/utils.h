#ifndef CODEJUDGE_UTILS_H_
#define CODEJUDGE_UTILS_H_

#include <string>
#include <filesystem>

#include <codejudge/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm644 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::others_read;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);
// reads at most max_bytes; truncated is set if the file is longer
bool ReadFile(const fs::path&, size_t max_bytes, std::string& content, bool& truncated);

// Search PATH if name contains no '/'; empty if not found or not executable
fs::path FindExecutable(const std::string& name);

// At most max_bytes of str, with a notice appended if anything was cut
std::string Excerpt(const std::string& str, size_t max_bytes, bool already_truncated = false);

#endif  // CODEJUDGE_UTILS_H_
