#ifndef INCLUDE_CODEJUDGE_PATHS_H_
#define INCLUDE_CODEJUDGE_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

// helper binary that runs one cjail sandbox (see sandbox_main.cpp)
fs::path SandboxExecPath();

#endif  // INCLUDE_CODEJUDGE_PATHS_H_
