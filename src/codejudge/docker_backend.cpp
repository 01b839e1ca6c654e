#include <codejudge/docker_backend.h>

#include <unistd.h>
#include <sys/wait.h>
#include <cstdlib>
#include <cstring>
#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <codejudge/judge.h>
#include "utils.h"
#include "process.h"
#include "invocation.h"

namespace {

constexpr long kRemoveTimeoutUs = 10'000'000;

// exit codes of `docker run` itself rather than of the contained command
constexpr int kDaemonError = 125;
constexpr int kCannotInvoke = 126;
constexpr int kNotFound = 127;
// the kernel OOM killer's SIGKILL as seen through `docker run`
constexpr int kOomKilled = 128 + 9;

// `docker rm -f`; the container may already be gone
void RemoveContainer(const fs::path& binary, const std::string& name) {
  ProcessOptions opt;
  opt.argv = {binary.string(), "rm", "-f", name};
  opt.timeout_us = kRemoveTimeoutUs;
  opt.max_stdout = opt.max_stderr = 4096;
  ExecutionMonitor monitor;
  ProcessResult res = RunProcess(opt, monitor);
  if (!res.started || !WIFEXITED(res.wait_status) || WEXITSTATUS(res.wait_status) != 0) {
    spdlog::debug("docker rm -f {} did not succeed: {}", name, res.stderr_data);
  }
}

} // namespace

bool DockerBackend::Probe(std::string& reason) const {
  if (FindExecutable(opt_.binary).empty()) {
    reason = "docker binary '" + opt_.binary + "' not found or not executable";
    return false;
  }
  std::string socket = opt_.socket;
  if (const char* host = getenv("DOCKER_HOST"); host && *host) {
    constexpr char kUnixPrefix[] = "unix://";
    if (strncmp(host, kUnixPrefix, sizeof(kUnixPrefix) - 1) == 0) {
      socket = host + sizeof(kUnixPrefix) - 1;
    } else {
      socket.clear(); // remote daemon; nothing to check locally
    }
  }
  if (socket.empty()) return true;
  std::error_code ec;
  if (!fs::exists(socket, ec)) {
    reason = "docker daemon socket " + socket + " does not exist";
    return false;
  }
  if (access(socket.c_str(), R_OK | W_OK) != 0) {
    reason = "docker daemon socket " + socket + " is not accessible: " + strerror(errno);
    return false;
  }
  return true;
}

RawExecutionResult DockerBackend::Run(const std::string& code, const nlohmann::json& input,
                                      const ExecutionLimits& limits, ExecutionMonitor& monitor) {
  if (std::string reason; !Probe(reason)) {
    spdlog::warn("docker backend unavailable: {}", reason);
    return RawExecutionResult::Unavailable(reason);
  }
  fs::path binary = FindExecutable(opt_.binary);
  std::string name = fmt::format("codejudge-{}-{}", getpid(), GetUniqueRunId());

  ProcessOptions popt;
  popt.argv = {
    binary.string(), "run", "--rm", "-i",
    "--name", name,
    "--network", opt_.network,
    "--memory", fmt::format("{}m", limits.memory_mb),
    "--memory-swap", fmt::format("{}m", limits.memory_mb),
    "--cpus", fmt::format("{}", limits.cpu_fraction),
  };
  if (opt_.pids_limit > 0) {
    popt.argv.insert(popt.argv.end(), {"--pids-limit", std::to_string(opt_.pids_limit)});
  }
  popt.argv.push_back(opt_.image);
  for (auto& i : InvocationCommand(opt_.python, opt_.invocation)) popt.argv.push_back(i);
  popt.stdin_data = InvocationPayload(code, input);
  // includes container startup
  popt.timeout_us = std::max(1L, (long)(limits.timeout_seconds * 1e6));
  popt.max_stdout = popt.max_stderr = opt_.invocation.max_output_kib * 1024;
  // killing the client does not stop the container
  popt.on_kill = [binary, name]() { RemoveContainer(binary, name); };

  spdlog::debug("docker run: name={} image={} memory={}m cpus={}",
                name, opt_.image, limits.memory_mb, limits.cpu_fraction);
  ProcessResult res = RunProcess(popt, monitor);

  RawExecutionResult ret;
  ret.wall_us = res.wall_us;
  if (!res.started) {
    ret.message = std::string("failed to start docker: ") + strerror(res.error);
    return ret;
  }
  ret.stdout_data = std::move(res.stdout_data);
  ret.stderr_data = std::move(res.stderr_data);
  ret.stderr_truncated = res.stderr_truncated;
  if (res.timed_out || res.terminated) {
    ret.status = RawStatus::TIMEOUT;
  } else if (WIFSIGNALED(res.wait_status)) {
    // the client died, the container may not have
    RemoveContainer(binary, name);
    ret.status = RawStatus::SIGNALED;
    ret.term_signal = WTERMSIG(res.wait_status);
  } else {
    int exit_code = WEXITSTATUS(res.wait_status);
    if (exit_code == kDaemonError || exit_code == kCannotInvoke || exit_code == kNotFound) {
      ret.status = RawStatus::SANDBOX_ERROR;
      ret.message = fmt::format("docker run failed with exit code {}", exit_code);
      spdlog::warn("docker run {} failed: exit_code={} stderr={}", name, exit_code, ret.stderr_data);
    } else if (exit_code == kOomKilled) {
      ret.status = RawStatus::MEMORY_EXCEEDED;
    } else if (exit_code > 128) {
      ret.status = RawStatus::SIGNALED;
      ret.term_signal = exit_code - 128;
    } else {
      ret.status = RawStatus::EXITED;
      ret.exit_code = exit_code;
    }
  }
  if (res.stdout_truncated && ret.status == RawStatus::EXITED) ret.status = RawStatus::OUTPUT_EXCEEDED;
  spdlog::debug("docker run finished: name={} status={} exit_code={} signal={} wall_us={}",
                name, RawStatusName(ret.status), ret.exit_code, ret.term_signal, ret.wall_us);
  return ret;
}
