#include "process.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <mutex>
#include <chrono>
#include <thread>
#include <cerrno>
#include <cstring>
#include <algorithm>

#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

using Clock = std::chrono::steady_clock;

// after SIGKILL, pipes kept open by escaped descendants are not waited for longer than this
constexpr auto kDrainGrace = std::chrono::seconds(1);
constexpr auto kReapPollInterval = std::chrono::milliseconds(10);

void IgnoreSigpipe() {
  static std::once_flag flag;
  // a child exiting before consuming its stdin must not kill the judge
  std::call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

void CloseFd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

bool SetNonblock(int fd) {
  int flags = fcntl(fd, F_GETFL);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) >= 0;
}

// returns false on EOF or error
bool DrainFd(int fd, std::string& buf, size_t max, bool& truncated) {
  char chunk[65536];
  while (true) {
    ssize_t n = read(fd, chunk, sizeof(chunk));
    if (n > 0) {
      size_t keep = buf.size() < max ? std::min(max - buf.size(), (size_t)n) : 0;
      buf.append(chunk, keep);
      if (keep < (size_t)n) truncated = true;
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
    return false;
  }
}

void KillGroup(pid_t pid) {
  if (kill(-pid, SIGKILL) < 0 && errno == ESRCH) kill(pid, SIGKILL);
}

// true if the child has exited; does not reap it
bool HasExited(pid_t pid) {
  siginfo_t info = {};
  if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) < 0) return errno != EINTR;
  return info.si_pid == pid;
}

} // namespace

ProcessResult RunProcess(const ProcessOptions& opt, ExecutionMonitor& monitor) {
  ProcessResult ret;
  IgnoreSigpipe();
  if (opt.argv.empty()) {
    ret.error = EINVAL;
    return ret;
  }
  // everything the child touches must be allocated before fork()
  std::vector<char*> argv;
  for (auto& i : opt.argv) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);

  int in_pipe[2] = {-1, -1}, out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, exec_pipe[2] = {-1, -1};
  auto CloseAll = [&]() {
    for (int* fds : {in_pipe, out_pipe, err_pipe, exec_pipe}) CloseFd(fds[0]), CloseFd(fds[1]);
  };
  auto Fail = [&](const char* what) {
    ret.error = errno;
    spdlog::warn("RunProcess {} error: errno={} {}", what, errno, strerror(errno));
    CloseAll();
    return ret;
  };

  if (pipe2(in_pipe, O_CLOEXEC) < 0 || pipe2(out_pipe, O_CLOEXEC) < 0 ||
      pipe2(err_pipe, O_CLOEXEC) < 0 || pipe2(exec_pipe, O_CLOEXEC) < 0) {
    return Fail("pipe");
  }
  pid_t pid = fork();
  if (pid < 0) return Fail("fork");
  if (pid == 0) {
    setpgid(0, 0);
    signal(SIGPIPE, SIG_DFL);
    dup2(in_pipe[0], 0);
    dup2(out_pipe[1], 1);
    dup2(err_pipe[1], 2);
    execvp(argv[0], argv.data());
    int e = errno;
    IGNORE_RETURN(write(exec_pipe[1], &e, sizeof(e)));
    _exit(127);
  }
  setpgid(pid, pid); // also done by the child; avoids racing with an early kill
  CloseFd(in_pipe[0]);
  CloseFd(out_pipe[1]);
  CloseFd(err_pipe[1]);
  CloseFd(exec_pipe[1]);
  {
    // exec_pipe is closed by a successful exec; otherwise the child reports errno
    int e = 0;
    ssize_t n;
    while ((n = read(exec_pipe[0], &e, sizeof(e))) < 0 && errno == EINTR);
    CloseFd(exec_pipe[0]);
    if (n == (ssize_t)sizeof(e)) {
      waitpid(pid, nullptr, 0);
      spdlog::warn("Failed executing {}: {}", opt.argv[0], strerror(e));
      ret.error = e;
      CloseAll();
      return ret;
    }
  }
  ret.started = true;
  spdlog::debug("Process started: pid={} command={} argc={}", pid, opt.argv[0], opt.argv.size());

  auto on_kill = opt.on_kill;
  monitor.SetTerminator([pid, on_kill]() {
    spdlog::info("Terminating process group {}", pid);
    KillGroup(pid);
    if (on_kill) on_kill();
  });

  SetNonblock(in_pipe[1]);
  SetNonblock(out_pipe[0]);
  SetNonblock(err_pipe[0]);
  size_t written = 0;
  if (opt.stdin_data.empty()) CloseFd(in_pipe[1]);

  auto start = Clock::now();
  auto deadline = opt.timeout_us > 0 ?
      start + std::chrono::microseconds(opt.timeout_us) : Clock::time_point::max();
  auto drain_deadline = Clock::time_point::max();
  bool killed = false;
  while (true) {
    auto now = Clock::now();
    if (!killed && now >= deadline) {
      spdlog::info("Process {} exceeded {} us; killing", pid, opt.timeout_us);
      ret.timed_out = true;
      KillGroup(pid);
      if (opt.on_kill) opt.on_kill();
      killed = true;
      drain_deadline = now + kDrainGrace;
    } else if (!killed && monitor.Terminated()) {
      // the terminator already killed the group
      killed = true;
      drain_deadline = now + kDrainGrace;
    }
    bool pipes_open = out_pipe[0] >= 0 || err_pipe[0] >= 0;
    if (!pipes_open || now >= drain_deadline) {
      if (HasExited(pid)) break;
      if (killed && now >= drain_deadline) break; // SIGKILLed; reaping below will not block long
      auto next = std::min(deadline, now + kReapPollInterval);
      std::this_thread::sleep_until(std::max(next, now));
      continue;
    }

    struct pollfd fds[3];
    int nfds = 0, in_idx = -1, out_idx = -1, err_idx = -1;
    auto AddFd = [&](int fd, short events) {
      fds[nfds] = {fd, events, 0};
      return nfds++;
    };
    if (in_pipe[1] >= 0) in_idx = AddFd(in_pipe[1], POLLOUT);
    if (out_pipe[0] >= 0) out_idx = AddFd(out_pipe[0], POLLIN);
    if (err_pipe[0] >= 0) err_idx = AddFd(err_pipe[0], POLLIN);
    auto until = std::min(deadline, drain_deadline);
    int timeout_ms = 100;
    if (until != Clock::time_point::max()) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - now).count() + 1;
      timeout_ms = (int)std::clamp<long>(left, 0, 100);
    }
    int res = poll(fds, nfds, timeout_ms);
    if (res < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("RunProcess poll error: {}", strerror(errno));
      KillGroup(pid);
      killed = true;
      break;
    }
    if (in_idx != -1 && fds[in_idx].revents) {
      if (fds[in_idx].revents & POLLOUT) {
        size_t len = std::min(opt.stdin_data.size() - written, (size_t)65536);
        ssize_t n = write(in_pipe[1], opt.stdin_data.data() + written, len);
        if (n > 0) {
          written += n;
        } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
          CloseFd(in_pipe[1]); // EPIPE: the child does not want more input
        }
        if (written == opt.stdin_data.size()) CloseFd(in_pipe[1]);
      } else {
        CloseFd(in_pipe[1]);
      }
    }
    if (out_idx != -1 && fds[out_idx].revents &&
        !DrainFd(out_pipe[0], ret.stdout_data, opt.max_stdout, ret.stdout_truncated)) {
      CloseFd(out_pipe[0]);
    }
    if (err_idx != -1 && fds[err_idx].revents &&
        !DrainFd(err_pipe[0], ret.stderr_data, opt.max_stderr, ret.stderr_truncated)) {
      CloseFd(err_pipe[0]);
    }
  }
  // no kill may target this pid once it is reaped
  monitor.ClearTerminator();
  ret.terminated = monitor.Terminated();
  while (waitpid(pid, &ret.wait_status, 0) < 0 && errno == EINTR);
  ret.wall_us = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();
  CloseAll();
  spdlog::debug("Process {} finished: status={} wall_us={} timed_out={} terminated={}",
                pid, ret.wait_status, ret.wall_us, ret.timed_out, ret.terminated);
  return ret;
}
