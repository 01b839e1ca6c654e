#include <codejudge/cjail_backend.h>

#include <unistd.h>
#include <sys/wait.h>
#include <cmath>
#include <chrono>
#include <cstring>
#include <algorithm>
#include <functional>

#include <spdlog/spdlog.h>
#include <codejudge/judge.h>
#include "paths.h"
#include "utils.h"
#include "invocation.h"
#include "sandbox_exec.h"

namespace {

constexpr fs::perms kPerm755 = kPerm644 |
    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;

// removes the box and gives back its uid/cpus on every return path
class BoxGuard {
  fs::path box_;
  std::function<void()> release_;
 public:
  BoxGuard(fs::path box, std::function<void()> release) :
      box_(std::move(box)), release_(std::move(release)) {}
  BoxGuard(const BoxGuard&) = delete;
  BoxGuard& operator=(const BoxGuard&) = delete;
  ~BoxGuard() {
    RemoveAll(box_);
    release_();
  }
};

} // namespace

CJailBackend::CJailBackend(CJailOptions opt) : opt_(std::move(opt)) {
  for (int i = 0; i < opt_.uid_pool_size; i++) uid_pool_.push_back(opt_.uid_base + i);
  cpu_pool_ = opt_.pinned_cpus;
}

bool CJailBackend::Acquire(int& uid, std::vector<int>& cpus, int cpu_count,
                           std::chrono::milliseconds wait) {
  std::unique_lock lck(pool_mtx_);
  if (!pool_cv_.wait_for(lck, wait, [&]() {
        return !uid_pool_.empty() && (int)cpu_pool_.size() >= cpu_count;
      })) {
    return false;
  }
  uid = uid_pool_.back();
  uid_pool_.pop_back();
  cpus.assign(cpu_pool_.end() - cpu_count, cpu_pool_.end());
  cpu_pool_.resize(cpu_pool_.size() - cpu_count);
  return true;
}

void CJailBackend::Release(int uid, const std::vector<int>& cpus) {
  {
    std::lock_guard lck(pool_mtx_);
    uid_pool_.push_back(uid);
    cpu_pool_.insert(cpu_pool_.end(), cpus.begin(), cpus.end());
  }
  pool_cv_.notify_all();
}

bool CJailBackend::Probe(std::string& reason) const {
  std::error_code ec;
  if (geteuid() != 0) {
    reason = "cjail requires root privileges";
    return false;
  }
  fs::path helper = SandboxExecPath();
  if (access(helper.c_str(), X_OK) != 0) {
    reason = "sandbox helper " + helper.string() + " is not executable: " + strerror(errno);
    return false;
  }
  if (opt_.python.empty() || opt_.python[0] != '/' || access(opt_.python.c_str(), X_OK) != 0) {
    reason = "python interpreter " + opt_.python + " is not an executable absolute path";
    return false;
  }
  if (!fs::is_directory("/sys/fs/cgroup", ec)) {
    reason = "cgroup filesystem is not mounted";
    return false;
  }
  if (opt_.uid_pool_size <= 0) {
    reason = "uid pool is empty";
    return false;
  }
  return true;
}

RawExecutionResult CJailBackend::Run(const std::string& code, const nlohmann::json& input,
                                     const ExecutionLimits& limits, ExecutionMonitor& monitor) {
  if (std::string reason; !Probe(reason)) {
    spdlog::warn("cjail backend unavailable: {}", reason);
    return RawExecutionResult::Unavailable(reason);
  }
  int cpu_count = std::min((int)std::ceil(limits.cpu_fraction), (int)opt_.pinned_cpus.size());
  int uid = -1;
  std::vector<int> cpus;
  auto wait = std::chrono::duration<double>(limits.timeout_seconds);
  if (!Acquire(uid, cpus, cpu_count, std::chrono::duration_cast<std::chrono::milliseconds>(wait))) {
    return RawExecutionResult::SandboxError("no free sandbox slot");
  }
  fs::path box = RunBoxPath(opt_.box_root, GetUniqueRunId());
  BoxGuard guard(box, [this, uid, cpus]() { Release(uid, cpus); });

  fs::path workdir = Workdir(fs::path(box));
  if (!CreateDirs(workdir, kPerm755) ||
      !WriteFile(BoxPayload(box), InvocationPayload(code, input), kPerm644)) {
    return RawExecutionResult::SandboxError("failed preparing box");
  }
  // the interpreter writes its output files as uid
  if (chown(workdir.c_str(), uid, uid) < 0) {
    spdlog::warn("Failed chown {}: {}", workdir.c_str(), strerror(errno));
    return RawExecutionResult::SandboxError("failed preparing box");
  }

  SandboxOptions opt;
  opt.boxdir = box;
  opt.command = InvocationCommand(opt_.python, opt_.invocation);
  opt.envs = {"PATH=/usr/local/bin:/usr/bin:/bin", "PYTHONDONTWRITEBYTECODE=1", "PYTHONIOENCODING=utf-8"};
  opt.workdir = Workdir("/");
  opt.input = BoxPayload(box, true);
  opt.output = BoxStdout(box, true);
  opt.error = BoxStderr(box, true);
  opt.cpu_set = cpus;
  opt.uid = opt.gid = uid;
  opt.wall_time = std::max(1L, (long)(limits.timeout_seconds * 1e6));
  opt.cpu_time = std::max(1L, (long)(limits.timeout_seconds * limits.cpu_fraction * 1e6));
  opt.rss = limits.memory_mb * 1024;
  opt.proc_num = 1;
  opt.fsize = opt_.invocation.max_output_kib;
  // Output files are accounted in cgroups, so we need to extend RSS limit
  opt.rss += opt.fsize * 2;
  opt.dirs = {"/usr", "/lib", "/lib64", "/etc/alternatives", "/bin"};
  opt.FilterDirs();

  auto start = std::chrono::steady_clock::now();
  struct cjail_result res = SandboxExec(opt, monitor);
  RawExecutionResult ret = ClassifyCJailResult(res);
  ret.wall_us = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start).count();
  if (ret.status == RawStatus::SANDBOX_ERROR) return ret;

  size_t max_output = opt_.invocation.max_output_kib * 1024;
  bool stdout_truncated = false;
  std::error_code ec;
  if (fs::exists(BoxStdout(box), ec) &&
      !ReadFile(BoxStdout(box), max_output, ret.stdout_data, stdout_truncated)) {
    return RawExecutionResult::SandboxError("failed reading output");
  }
  if (fs::exists(BoxStderr(box), ec) &&
      !ReadFile(BoxStderr(box), max_output, ret.stderr_data, ret.stderr_truncated)) {
    return RawExecutionResult::SandboxError("failed reading output");
  }
  if (stdout_truncated && ret.status == RawStatus::EXITED) ret.status = RawStatus::OUTPUT_EXCEEDED;
  spdlog::debug("cjail run finished: box={} uid={} status={} exit_code={} signal={} wall_us={}",
                box.c_str(), uid, RawStatusName(ret.status), ret.exit_code, ret.term_signal, ret.wall_us);
  return ret;
}
