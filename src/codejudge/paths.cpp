#include "paths.h"

#include <unistd.h>
#include <string>

namespace internal {
fs::path kDataDir = fs::path(CODEJUDGE_DATA_DIR);
} // internal

static const char kWorkdirRelative[] = "workdir";
fs::path Workdir(fs::path&& path) {
  path /= kWorkdirRelative;
  return path;
}

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

inline fs::path BoxRoot(const fs::path& box, bool inside_box) {
  return inside_box ? fs::path("/") : box;
}

} // namespace

fs::path SandboxExecPath() {
  return internal::kDataDir / "sandbox-exec";
}

// boxes of several judge processes may share one root
fs::path RunBoxPath(const fs::path& root, long id) {
  return root / (std::to_string(getpid()) + "_" + PadInt(id, 6));
}

fs::path BoxPayload(const fs::path& box, bool inside_box) {
  return Workdir(BoxRoot(box, inside_box)) / "payload.json";
}
fs::path BoxStdout(const fs::path& box, bool inside_box) {
  return Workdir(BoxRoot(box, inside_box)) / "stdout";
}
fs::path BoxStderr(const fs::path& box, bool inside_box) {
  return Workdir(BoxRoot(box, inside_box)) / "stderr";
}
