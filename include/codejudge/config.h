#ifndef INCLUDE_CODEJUDGE_CONFIG_H_
#define INCLUDE_CODEJUDGE_CONFIG_H_

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>
#include <filesystem>

#include "judge.h"
#include "backend.h"
#include "docker_backend.h"
#include "cjail_backend.h"

#define ENUM_BACKEND_TYPE_ \
  X(DOCKER, "docker") \
  X(CJAIL, "cjail")
enum class BackendType {
#define X(name, str) name,
  ENUM_BACKEND_TYPE_
#undef X
};

const char* BackendTypeName(BackendType);
bool ParseBackendType(const std::string&, BackendType&);

struct JudgeConfig {
  BackendType backend;
  ExecutionLimits limits; // defaults for every submission
  JudgeOptions judge;
  InvocationOptions invocation; // copied into the selected backend's options
  DockerOptions docker;
  CJailOptions cjail;

  JudgeConfig() : backend(BackendType::DOCKER) {}
};

// INI format; keys absent from the file keep their current values in config
bool LoadConfig(std::istream&, JudgeConfig& config, std::string& error);
bool LoadConfig(const std::filesystem::path&, JudgeConfig& config, std::string& error);

std::shared_ptr<IsolationBackend> MakeBackend(const JudgeConfig&);

// "all", "none" or a comma-separated list of CPUs and ranges, e.g. "0-3,6"
bool ParseCpuList(const std::string& str, std::vector<int>& cpus, int ncpu);

#endif  // INCLUDE_CODEJUDGE_CONFIG_H_
