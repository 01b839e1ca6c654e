#include "sandbox_exec.h"

#include <cerrno>
#include <cstring>
#include <signal.h>
#include <sys/wait.h>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <codejudge/paths.h>
#include "process.h"

namespace {

// the helper gets this much longer than the jail's own wall limit before it is killed
constexpr long kHelperMarginUs = 2'000'000;

// the helper outlived the jail's wall limit; treated like cjail's own time kill
struct cjail_result TimeKilled() {
  struct cjail_result ret = {};
  ret.timekill = 1;
  return ret;
}

struct cjail_result SandboxError(int err) {
  struct cjail_result ret = {};
  ret.oomkill = err;
  ret.timekill = -1;
  return ret;
}

} // namespace

struct cjail_result SandboxExec(const SandboxOptions& opt, ExecutionMonitor& monitor) {
  spdlog::debug("cjail_exec boxdir={} command={}", opt.boxdir, fmt::format("{}", opt.command));
  ProcessOptions popt;
  popt.argv = {SandboxExecPath().string()};
  popt.stdin_data = opt.ToJson().dump();
  popt.timeout_us = opt.wall_time > 0 ? opt.wall_time + kHelperMarginUs : 0;
  popt.max_stdout = sizeof(struct cjail_result);
  popt.max_stderr = 4096;
  ProcessResult res = RunProcess(popt, monitor);
  if (!res.started) {
    spdlog::warn("SandboxExec error: errno={} {}", res.error, strerror(res.error));
    return SandboxError(res.error);
  }
  if (res.timed_out || res.terminated) {
    spdlog::warn("sandbox-exec helper killed: timed_out={} terminated={}", res.timed_out, res.terminated);
    return TimeKilled();
  }
  if (!WIFEXITED(res.wait_status) || WEXITSTATUS(res.wait_status) != 0 ||
      res.stdout_data.size() != sizeof(struct cjail_result)) {
    spdlog::warn("sandbox-exec helper failed: status={} output={} bytes stderr={}",
                 res.wait_status, res.stdout_data.size(), res.stderr_data);
    return SandboxError(EPROTO);
  }
  struct cjail_result ret;
  memcpy(&ret, res.stdout_data.data(), sizeof(ret));
  if (ret.timekill == -1) {
    spdlog::warn("cjail_exec error: errno={} {}", ret.oomkill, strerror(ret.oomkill));
  }
  return ret;
}

RawExecutionResult ClassifyCJailResult(const struct cjail_result& res) {
  RawExecutionResult ret;
  if (res.timekill == -1) {
    // timekill = -1 means SandboxExec error (see SandboxExec above, sandbox_main.cpp)
    return RawExecutionResult::SandboxError(std::string("sandbox failed: ") + strerror(res.oomkill));
  } else if (res.oomkill > 0) {
    // oomkill = -1 means failed to read oom (see cjail/cjail.h)
    ret.status = RawStatus::MEMORY_EXCEEDED;
  } else if (res.timekill) {
    ret.status = RawStatus::TIMEOUT;
  } else if (res.info.si_code == CLD_KILLED || res.info.si_code == CLD_DUMPED) {
    if (res.info.si_status == SIGXFSZ) {
      ret.status = RawStatus::OUTPUT_EXCEEDED;
    } else {
      ret.status = RawStatus::SIGNALED;
      ret.term_signal = res.info.si_status;
    }
  } else {
    ret.status = RawStatus::EXITED;
    ret.exit_code = res.info.si_status;
  }
  return ret;
}
