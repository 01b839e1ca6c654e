#ifndef CODEJUDGE_PROCESS_H_
#define CODEJUDGE_PROCESS_H_

#include <string>
#include <vector>
#include <functional>

#include <codejudge/backend.h>

struct ProcessOptions {
  std::vector<std::string> argv; // argv[0] is looked up in PATH
  std::string stdin_data;
  long timeout_us; // 0 for no limit
  size_t max_stdout, max_stderr; // excess output is drained and discarded
  // run right after the process group is killed (timeout or ExecutionMonitor::Terminate)
  std::function<void()> on_kill;

  ProcessOptions() : timeout_us(0), max_stdout(1 << 20), max_stderr(1 << 20) {}
};

struct ProcessResult {
  bool started;
  int error; // errno if !started
  int wait_status;
  bool timed_out; // killed by our own deadline
  bool terminated; // killed through the monitor
  std::string stdout_data, stderr_data;
  bool stdout_truncated, stderr_truncated;
  long wall_us;

  ProcessResult() :
      started(false), error(0), wait_status(0), timed_out(false), terminated(false),
      stdout_truncated(false), stderr_truncated(false), wall_us(0) {}
};

// Runs argv in its own process group, feeding stdin_data and capturing bounded
// stdout/stderr. The whole group is SIGKILLed on timeout or when the monitor is
// terminated. Always reaps the child before returning.
ProcessResult RunProcess(const ProcessOptions&, ExecutionMonitor&);

#endif  // CODEJUDGE_PROCESS_H_
