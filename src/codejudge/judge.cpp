#include <codejudge/judge.h>

#include <sys/sysinfo.h>
#include <cmath>
#include <chrono>
#include <future>
#include <utility>
#include <algorithm>
#include <system_error>
#include <thread>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <codejudge/backend.h>
#include "utils.h"
#include "invocation.h"

namespace {

using Clock = std::chrono::steady_clock;

// keep microsecond and KiB conversions of the limits far from overflowing long
constexpr double kMaxTimeoutSeconds = 24 * 3600;
constexpr long kMaxMemoryMb = 1L << 20;

// supervisor timings come from JudgeOptions unchecked; NaN becomes 0
Clock::duration Seconds(double seconds) {
  double clamped = seconds > 0 ? std::min(seconds, 2 * kMaxTimeoutSeconds) : 0;
  return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(clamped));
}

// reporter failures are logged and do not affect judging
template <class Func, class... Args>
void Report(const char* what, const Func& func, Args&&... args) {
  if (!func) return;
  try {
    func(std::forward<Args>(args)...);
  } catch (std::exception& e) {
    spdlog::error("Reporter {} raised: {}", what, e.what());
  } catch (...) {
    spdlog::error("Reporter {} raised a non-standard exception", what);
  }
}

long ElapsedMs(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

// Everything a backend call touches; shared with the worker so that a worker
// abandoned after its deadline never sees freed memory.
struct BackendCall {
  std::shared_ptr<IsolationBackend> backend;
  std::string code;
  nlohmann::json input;
  ExecutionLimits limits;
  ExecutionMonitor monitor;
};

CaseOutcome ErrorOutcome(long duration_ms, std::string message, const RawExecutionResult& raw,
                         size_t max_stderr) {
  CaseOutcome ret(CaseStatus::ERROR, duration_ms, std::move(message));
  if (!raw.stderr_data.empty() || raw.stderr_truncated) {
    ret.stderr_excerpt = Excerpt(raw.stderr_data, max_stderr, raw.stderr_truncated);
  }
  return ret;
}

CaseOutcome ClassifyRawResult(const RawExecutionResult& raw, const TestCase& test_case,
                              const ExecutionLimits& limits, long duration_ms, size_t max_stderr) {
  switch (raw.status) {
    case RawStatus::UNAVAILABLE:
      return CaseOutcome(CaseStatus::BACKEND_UNAVAILABLE, duration_ms, raw.message);
    case RawStatus::TIMEOUT:
      return CaseOutcome(CaseStatus::TIMEOUT, duration_ms,
                         fmt::format("Timeout exceeded ({}s)", limits.timeout_seconds));
    case RawStatus::MEMORY_EXCEEDED:
      return ErrorOutcome(duration_ms, fmt::format("Memory limit exceeded ({} MB)", limits.memory_mb),
                          raw, max_stderr);
    case RawStatus::OUTPUT_EXCEEDED:
      return ErrorOutcome(duration_ms, "Output limit exceeded", raw, max_stderr);
    case RawStatus::SIGNALED:
      return ErrorOutcome(duration_ms, fmt::format("Killed by signal {}", raw.term_signal), raw, max_stderr);
    case RawStatus::SANDBOX_ERROR:
      return ErrorOutcome(duration_ms, "Sandbox error: " + raw.message, raw, max_stderr);
    case RawStatus::EXITED: break;
  }
  if (raw.exit_code != 0) {
    return ErrorOutcome(duration_ms, fmt::format("Exited with code {}", raw.exit_code), raw, max_stderr);
  }
  nlohmann::json actual;
  std::string error;
  if (!ParseResultLine(raw.stdout_data, actual, error)) {
    return ErrorOutcome(duration_ms, "Invalid output: " + error, raw, max_stderr);
  }
  bool matches = OutputMatches(actual, test_case.expected_output);
  CaseOutcome ret(matches ? CaseStatus::PASSED : CaseStatus::FAILED, duration_ms);
  ret.actual_output = std::move(actual);
  return ret;
}

} // namespace

bool ValidateLimits(const ExecutionLimits& limits, std::string& reason) {
  // also rejects NaN
  if (!(limits.timeout_seconds > 0)) {
    reason = fmt::format("timeout_seconds must be positive (got {})", limits.timeout_seconds);
    return false;
  }
  if (!std::isfinite(limits.timeout_seconds) || limits.timeout_seconds > kMaxTimeoutSeconds) {
    reason = fmt::format("timeout_seconds must not exceed {} (got {})",
                         kMaxTimeoutSeconds, limits.timeout_seconds);
    return false;
  }
  if (limits.memory_mb <= 0 || limits.memory_mb > kMaxMemoryMb) {
    reason = fmt::format("memory_mb must be in [1, {}] (got {})", kMaxMemoryMb, limits.memory_mb);
    return false;
  }
  if (!(limits.cpu_fraction > 0)) {
    reason = fmt::format("cpu_fraction must be positive (got {})", limits.cpu_fraction);
    return false;
  }
  if (int ncpu = get_nprocs(); limits.cpu_fraction > ncpu) {
    reason = fmt::format("cpu_fraction {} exceeds the {} available cores", limits.cpu_fraction, ncpu);
    return false;
  }
  return true;
}

Judge::Judge(std::shared_ptr<IsolationBackend> backend, JudgeOptions options) :
    backend_(std::move(backend)), options_(options) {}

// Runs one case under the supervising deadline; never blocks longer than
// timeout + supervisor_margin + terminate_grace (plus the backend's own kill action).
CaseOutcome Judge::RunCase(const std::string& code, const TestCase& test_case,
                           const ExecutionLimits& limits) const {
  auto start = Clock::now();
  if (!backend_) {
    return CaseOutcome(CaseStatus::BACKEND_UNAVAILABLE, 0, "No isolation backend configured");
  }
  auto call = std::make_shared<BackendCall>();
  call->backend = backend_;
  call->code = code;
  call->input = test_case.input;
  call->limits = limits;

  std::packaged_task<RawExecutionResult()> task([call]() {
    return call->backend->Run(call->code, call->input, call->limits, call->monitor);
  });
  std::future<RawExecutionResult> result = task.get_future();
  std::thread worker;
  try {
    worker = std::thread(std::move(task));
  } catch (std::system_error& e) {
    spdlog::error("Failed starting backend worker: {}", e.what());
    return CaseOutcome(CaseStatus::ERROR, ElapsedMs(start), std::string("Internal error: ") + e.what());
  }

  auto deadline = start + Seconds(limits.timeout_seconds) + Seconds(options_.supervisor_margin_seconds);
  if (result.wait_until(deadline) == std::future_status::timeout) {
    spdlog::warn("Backend {} did not return within {}s; terminating",
                 backend_->Name(), limits.timeout_seconds + options_.supervisor_margin_seconds);
    call->monitor.Terminate();
    if (result.wait_for(Seconds(options_.terminate_grace_seconds)) == std::future_status::timeout) {
      spdlog::error("Backend {} still running after forcible termination; abandoning it", backend_->Name());
      worker.detach();
    } else {
      worker.join();
    }
    return CaseOutcome(CaseStatus::TIMEOUT, ElapsedMs(start),
                       fmt::format("Timeout exceeded ({}s)", limits.timeout_seconds));
  }
  worker.join();
  RawExecutionResult raw;
  try {
    raw = result.get();
  } catch (std::exception& e) {
    spdlog::error("Backend {} raised: {}", backend_->Name(), e.what());
    return CaseOutcome(CaseStatus::ERROR, ElapsedMs(start), std::string("Internal error: ") + e.what());
  } catch (...) {
    spdlog::error("Backend {} raised a non-standard exception", backend_->Name());
    return CaseOutcome(CaseStatus::ERROR, ElapsedMs(start), "Internal error: unknown exception");
  }
  long duration_ms = ElapsedMs(start);
  spdlog::debug("Backend {} returned status={} exit_code={} signal={} duration_ms={}",
                backend_->Name(), RawStatusName(raw.status), raw.exit_code, raw.term_signal, duration_ms);
  if (call->monitor.Terminated()) {
    return CaseOutcome(CaseStatus::TIMEOUT, duration_ms,
                       fmt::format("Timeout exceeded ({}s)", limits.timeout_seconds));
  }
  return ClassifyRawResult(raw, test_case, limits, duration_ms, options_.max_stderr_bytes);
}

SubmissionResult Judge::Run(const std::string& code, const std::vector<TestCase>& cases,
                            const ExecutionLimits& limits, const Reporter& reporter) const {
  JudgeState state = JudgeState::NOT_STARTED;
  auto Transit = [&](JudgeState to) {
    spdlog::debug("Judge state {} -> {}", JudgeStateName(state), JudgeStateName(to));
    Report("state change", reporter.ReportStateChange, state, to);
    state = to;
  };

  Transit(JudgeState::RUNNING);
  std::string invalid_reason;
  bool limits_valid = ValidateLimits(limits, invalid_reason);
  if (!limits_valid) spdlog::warn("Invalid execution limits: {}", invalid_reason);

  std::vector<CaseOutcome> outcomes;
  outcomes.reserve(cases.size());
  std::string fallback_reason;
  for (size_t i = 0; i < cases.size(); i++) {
    if (!limits_valid) {
      outcomes.emplace_back(CaseStatus::ERROR, 0, "Invalid execution limits: " + invalid_reason);
    } else if (state == JudgeState::FALLBACK) {
      // the backend is not contacted again within this submission
      outcomes.emplace_back(CaseStatus::BACKEND_UNAVAILABLE, 0, fallback_reason);
    } else {
      outcomes.push_back(RunCase(code, cases[i], limits));
      if (outcomes.back().status == CaseStatus::BACKEND_UNAVAILABLE) {
        fallback_reason = outcomes.back().message;
        spdlog::warn("Isolation backend unavailable ({}); using mock execution for the remaining cases",
                     fallback_reason);
        Transit(JudgeState::FALLBACK);
      }
    }
    spdlog::info("Case {}/{}: {} duration_ms={}", i + 1, cases.size(),
                 CaseStatusName(outcomes.back().status), outcomes.back().duration_ms);
    Report("case result", reporter.ReportCaseResult, i, outcomes.back());
  }
  Transit(JudgeState::COMPLETED);

  SubmissionResult result = SubmissionResult::Aggregate(std::move(outcomes));
  spdlog::info("Submission judged: status={} passed={}/{}", OverallStatusName(result.overall_status()),
               result.passed_count(), result.total_count());
  Report("overall result", reporter.ReportOverallResult, result);
  return result;
}
