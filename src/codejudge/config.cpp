#include <codejudge/config.h>

#include <sys/sysinfo.h>
#include <set>
#include <fstream>
#include <cstdlib>

#include <tortellini.hh>
#include <spdlog/spdlog.h>

static const char* kBackendTypeTable[] = {
#define X(name, str) str,
  ENUM_BACKEND_TYPE_
#undef X
};

const char* BackendTypeName(BackendType type) {
  return kBackendTypeTable[(int)type];
}

bool ParseBackendType(const std::string& str, BackendType& type) {
  for (size_t i = 0; i < sizeof(kBackendTypeTable) / sizeof(kBackendTypeTable[0]); i++) {
    if (str == kBackendTypeTable[i]) {
      type = (BackendType)i;
      return true;
    }
  }
  return false;
}

namespace {

constexpr double kMaxSupervisorSeconds = 3600;

bool ParseCpu(const std::string& str, int ncpu, int& cpu) {
  if (str.empty()) return false;
  char* end;
  long val = strtol(str.c_str(), &end, 10);
  if (*end || val < 0 || val >= ncpu) return false;
  cpu = val;
  return true;
}

} // namespace

bool ParseCpuList(const std::string& str, std::vector<int>& cpus, int ncpu) {
  if (str == "all") {
    cpus.clear();
    for (int i = 0; i < ncpu; i++) cpus.push_back(i);
    return true;
  }
  if (str.empty() || str == "none") {
    cpus.clear();
    return true;
  }
  std::set<int> ret;
  size_t begin = 0;
  while (begin <= str.size()) {
    size_t end = str.find(',', begin);
    if (end == std::string::npos) end = str.size();
    std::string item = str.substr(begin, end - begin);
    size_t dash = item.find('-');
    int first, last;
    if (dash == std::string::npos) {
      if (!ParseCpu(item, ncpu, first)) return false;
      last = first;
    } else if (!ParseCpu(item.substr(0, dash), ncpu, first) ||
               !ParseCpu(item.substr(dash + 1), ncpu, last) || first > last) {
      return false;
    }
    for (int i = first; i <= last; i++) ret.insert(i);
    begin = end + 1;
  }
  cpus.assign(ret.begin(), ret.end());
  return true;
}

bool LoadConfig(std::istream& in, JudgeConfig& config, std::string& error) {
  tortellini::ini ini;
  in >> ini;

  std::string backend = ini[""]["backend"] | std::string(BackendTypeName(config.backend));
  if (!ParseBackendType(backend, config.backend)) {
    error = "unknown backend '" + backend + "'";
    return false;
  }
  config.limits.timeout_seconds = ini[""]["timeout_seconds"] | config.limits.timeout_seconds;
  config.limits.memory_mb = ini[""]["memory_mb"] | config.limits.memory_mb;
  config.limits.cpu_fraction = ini[""]["cpu_fraction"] | config.limits.cpu_fraction;
  config.invocation.entry_point = ini[""]["entry_point"] | config.invocation.entry_point;
  config.invocation.max_output_kib = ini[""]["max_output_kib"] | config.invocation.max_output_kib;
  config.judge.supervisor_margin_seconds =
      ini[""]["supervisor_margin_seconds"] | config.judge.supervisor_margin_seconds;
  config.judge.terminate_grace_seconds =
      ini[""]["terminate_grace_seconds"] | config.judge.terminate_grace_seconds;
  config.judge.max_stderr_bytes = ini[""]["max_stderr_bytes"] | (long)config.judge.max_stderr_bytes;

  config.docker.binary = ini["docker"]["binary"] | config.docker.binary;
  config.docker.image = ini["docker"]["image"] | config.docker.image;
  config.docker.python = ini["docker"]["python"] | config.docker.python;
  config.docker.socket = ini["docker"]["socket"] | config.docker.socket;
  config.docker.network = ini["docker"]["network"] | config.docker.network;
  config.docker.pids_limit = ini["docker"]["pids_limit"] | config.docker.pids_limit;

  config.cjail.box_root = ini["cjail"]["box_root"] | config.cjail.box_root.string();
  config.cjail.python = ini["cjail"]["python"] | config.cjail.python;
  config.cjail.uid_base = ini["cjail"]["uid_base"] | config.cjail.uid_base;
  config.cjail.uid_pool_size = ini["cjail"]["uid_pool_size"] | config.cjail.uid_pool_size;
  if (std::string pinned = ini["cjail"]["pinned_cpus"] | std::string(); !pinned.empty()) {
    if (!ParseCpuList(pinned, config.cjail.pinned_cpus, get_nprocs())) {
      error = "invalid pinned_cpus '" + pinned + "'";
      return false;
    }
  }

  if (config.invocation.entry_point.empty()) {
    error = "entry_point must not be empty";
    return false;
  }
  if (config.invocation.max_output_kib <= 0 || config.cjail.uid_pool_size <= 0) {
    error = "max_output_kib and uid_pool_size must be positive";
    return false;
  }
  // also rejects NaN
  for (double seconds : {config.judge.supervisor_margin_seconds, config.judge.terminate_grace_seconds}) {
    if (!(seconds >= 0 && seconds <= kMaxSupervisorSeconds)) {
      error = "supervisor timings must be between 0 and " + std::to_string((int)kMaxSupervisorSeconds) + " seconds";
      return false;
    }
  }
  return true;
}

bool LoadConfig(const std::filesystem::path& path, JudgeConfig& config, std::string& error) {
  std::ifstream fin(path);
  if (!fin) {
    error = "cannot open " + path.string();
    return false;
  }
  return LoadConfig(fin, config, error);
}

std::shared_ptr<IsolationBackend> MakeBackend(const JudgeConfig& config) {
  switch (config.backend) {
    case BackendType::DOCKER: {
      DockerOptions opt = config.docker;
      opt.invocation = config.invocation;
      return std::make_shared<DockerBackend>(std::move(opt));
    }
    case BackendType::CJAIL: {
      CJailOptions opt = config.cjail;
      opt.invocation = config.invocation;
      return std::make_shared<CJailBackend>(std::move(opt));
    }
  }
  __builtin_unreachable();
}
