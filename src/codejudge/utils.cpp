#include "utils.h"

#include <unistd.h>
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <fstream>

#include <spdlog/spdlog.h>

namespace {

std::atomic_long run_id_seq = 0;

} // namespace

long GetUniqueRunId() {
  return ++run_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(CaseStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* CaseStatusName, CaseStatus, ENUM_CASE_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(OverallStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OverallStatusName, OverallStatus, ENUM_OVERALL_STATUS_)
#undef X

#define X(...) X_RETURN_ARG1(JudgeState, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* JudgeStateName, JudgeState, ENUM_JUDGE_STATE_)
#undef X

#define X(...) X_RETURN_ARG1(RawStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* RawStatusName, RawStatus, ENUM_RAW_STATUS_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2

static const char* kOverallStatusTable[] = {
#define X(name, str) str,
  ENUM_OVERALL_STATUS_
#undef X
};

bool ParseOverallStatus(const std::string& str, OverallStatus& status) {
  for (size_t i = 0; i < sizeof(kOverallStatusTable) / sizeof(kOverallStatusTable[0]); i++) {
    if (str == kOverallStatusTable[i]) {
      status = (OverallStatus)i;
      return true;
    }
  }
  return false;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size())) {
      spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  std::error_code ec;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permission of {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool ReadFile(const fs::path& path, size_t max_bytes, std::string& content, bool& truncated) {
  std::error_code ec;
  uintmax_t total_length = fs::file_size(path, ec);
  if (ec) {
    spdlog::warn("Failed reading {}: {}", path.c_str(), ec.message());
    return false;
  }
  std::ifstream fin(path, std::ios::binary);
  if (!fin) {
    spdlog::warn("Failed opening {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  content.assign(std::min<uintmax_t>(total_length, max_bytes), '\0');
  fin.read(content.data(), content.size());
  content.resize(fin.gcount());
  truncated = total_length > max_bytes;
  return true;
}

fs::path FindExecutable(const std::string& name) {
  if (name.empty()) return {};
  if (name.find('/') != std::string::npos) {
    return access(name.c_str(), X_OK) == 0 ? fs::path(name) : fs::path();
  }
  const char* env = getenv("PATH");
  std::string path_list = env ? env : "/usr/local/bin:/usr/bin:/bin";
  size_t begin = 0;
  while (begin <= path_list.size()) {
    size_t end = path_list.find(':', begin);
    if (end == std::string::npos) end = path_list.size();
    std::string dir = path_list.substr(begin, end - begin);
    if (dir.empty()) dir = ".";
    fs::path candidate = fs::path(dir) / name;
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) return candidate;
    begin = end + 1;
  }
  return {};
}

std::string Excerpt(const std::string& str, size_t max_bytes, bool already_truncated) {
  if (str.size() <= max_bytes && !already_truncated) return str;
  std::string ret = str.substr(0, max_bytes);
  ret += "\n[Output truncated after " + std::to_string(ret.size()) + " bytes]";
  return ret;
}
