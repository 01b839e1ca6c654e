#ifndef INCLUDE_CODEJUDGE_BACKEND_H_
#define INCLUDE_CODEJUDGE_BACKEND_H_

#include <mutex>
#include <string>
#include <functional>

#include <nlohmann/json_fwd.hpp>

struct ExecutionLimits;

#define ENUM_RAW_STATUS_ \
  X(EXITED) /* exit_code is valid */ \
  X(SIGNALED) /* term_signal is valid */ \
  X(MEMORY_EXCEEDED) \
  X(OUTPUT_EXCEEDED) \
  X(TIMEOUT) \
  X(SANDBOX_ERROR) /* the unit could not be set up or reaped */ \
  X(UNAVAILABLE) /* the isolation mechanism cannot be reached; nothing was launched */
enum class RawStatus {
#define X(name) name,
  ENUM_RAW_STATUS_
#undef X
};

struct RawExecutionResult {
  RawStatus status;
  int exit_code;
  int term_signal;
  std::string stdout_data, stderr_data;
  bool stderr_truncated;
  long wall_us;
  std::string message; // reason of UNAVAILABLE / SANDBOX_ERROR

  RawExecutionResult() :
      status(RawStatus::SANDBOX_ERROR), exit_code(0), term_signal(0),
      stderr_truncated(false), wall_us(0) {}

  static RawExecutionResult Unavailable(std::string reason) {
    RawExecutionResult ret;
    ret.status = RawStatus::UNAVAILABLE;
    ret.message = std::move(reason);
    return ret;
  }
  static RawExecutionResult SandboxError(std::string reason) {
    RawExecutionResult ret;
    ret.status = RawStatus::SANDBOX_ERROR;
    ret.message = std::move(reason);
    return ret;
  }
};

// How the submitted code is called inside the unit (see invocation.h)
struct InvocationOptions {
  std::string entry_point;
  long max_output_kib; // applies to stdout and stderr separately

  InvocationOptions() : entry_point("solution"), max_output_kib(1024) {}
};

// Shared between a running backend call and its supervisor.
// The backend registers how to forcibly kill the isolation unit it launched;
// the supervisor may call Terminate() from any thread at any time.
class ExecutionMonitor {
  mutable std::mutex mtx_;
  std::function<void()> terminator_;
  bool terminated_;
 public:
  ExecutionMonitor() : terminated_(false) {}
  ExecutionMonitor(const ExecutionMonitor&) = delete;
  ExecutionMonitor& operator=(const ExecutionMonitor&) = delete;

  // runs the terminator immediately if Terminate() was already called
  void SetTerminator(std::function<void()>);
  void ClearTerminator();
  void Terminate();
  bool Terminated() const;
};

class IsolationBackend {
 public:
  virtual ~IsolationBackend() = default;

  virtual const char* Name() const = 0;
  // Structured precondition check; does not launch anything.
  // Returns false and sets reason if the isolation mechanism cannot be used.
  virtual bool Probe(std::string& reason) const = 0;
  // Runs code against one input in a fresh isolation unit; the unit is destroyed
  // before returning. Returns UNAVAILABLE iff Probe() fails. Must be thread-safe.
  virtual RawExecutionResult Run(const std::string& code, const nlohmann::json& input,
                                 const ExecutionLimits& limits, ExecutionMonitor& monitor) = 0;
};

#endif  // INCLUDE_CODEJUDGE_BACKEND_H_
