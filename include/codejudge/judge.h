#ifndef INCLUDE_CODEJUDGE_JUDGE_H_
#define INCLUDE_CODEJUDGE_JUDGE_H_

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>

#include <nlohmann/json.hpp>

class IsolationBackend;

struct TestCase {
  nlohmann::json input;
  nlohmann::json expected_output;
};

struct ExecutionLimits {
  double timeout_seconds;
  long memory_mb;
  // number of cores; must not exceed the cores of this machine
  double cpu_fraction;

  ExecutionLimits() : timeout_seconds(10), memory_mb(256), cpu_fraction(0.5) {}
  ExecutionLimits(double timeout, long memory, double cpus) :
      timeout_seconds(timeout), memory_mb(memory), cpu_fraction(cpus) {}
};

// return false and set reason if any limit is out of range
bool ValidateLimits(const ExecutionLimits&, std::string& reason);

#define ENUM_CASE_STATUS_ \
  X(PASSED, "passed") \
  X(FAILED, "failed") \
  X(ERROR, "error") \
  X(TIMEOUT, "timeout") \
  X(BACKEND_UNAVAILABLE, "backend_unavailable")
enum class CaseStatus {
#define X(name, str) name,
  ENUM_CASE_STATUS_
#undef X
};

// the order is the reporting precedence; see Aggregate()
#define ENUM_OVERALL_STATUS_ \
  X(PASSED, "passed") \
  X(FAILED, "failed") \
  X(ERROR, "error") \
  X(WARNING, "warning")
enum class OverallStatus {
#define X(name, str) name,
  ENUM_OVERALL_STATUS_
#undef X
};

#define ENUM_JUDGE_STATE_ \
  X(NOT_STARTED) \
  X(RUNNING) \
  X(FALLBACK) /* sticky: no further real execution in this submission */ \
  X(COMPLETED)
enum class JudgeState {
#define X(name) name,
  ENUM_JUDGE_STATE_
#undef X
};

struct CaseOutcome {
  CaseStatus status;
  std::optional<nlohmann::json> actual_output;
  std::optional<std::string> stderr_excerpt;
  long duration_ms;
  std::string message; // diagnostic only

  CaseOutcome(CaseStatus status, long duration_ms, std::string message = "") :
      status(status), duration_ms(duration_ms), message(std::move(message)) {}
};

class SubmissionResult {
 public:
  // The only way to obtain a SubmissionResult
  static SubmissionResult Aggregate(std::vector<CaseOutcome>&& outcomes);

  OverallStatus overall_status() const { return overall_status_; }
  const std::vector<CaseOutcome>& case_outcomes() const { return case_outcomes_; }
  int passed_count() const { return passed_count_; }
  int total_count() const { return (int)case_outcomes_.size(); }
  const std::string& message() const { return message_; }

 private:
  SubmissionResult() : overall_status_(OverallStatus::FAILED), passed_count_(0) {}

  OverallStatus overall_status_;
  std::vector<CaseOutcome> case_outcomes_;
  int passed_count_;
  std::string message_;
};

struct JudgeOptions {
  // added to timeout_seconds to get the supervising deadline of one case
  double supervisor_margin_seconds;
  // time to wait for the backend after forcible termination before giving up on it
  double terminate_grace_seconds;
  size_t max_stderr_bytes;

  JudgeOptions() :
      supervisor_margin_seconds(2.0),
      terminate_grace_seconds(1.0),
      max_stderr_bytes(4000) {}
};

class Judge {
 public:
  struct Reporter {
    // these functions should not block
    std::function<void(JudgeState from, JudgeState to)> ReportStateChange;
    std::function<void(size_t index, const CaseOutcome&)> ReportCaseResult;
    std::function<void(const SubmissionResult&)> ReportOverallResult;
  };

  explicit Judge(std::shared_ptr<IsolationBackend> backend, JudgeOptions options = JudgeOptions());

  // Never throws; every failure is expressed as a CaseOutcome.
  // Safe to call concurrently from multiple threads.
  SubmissionResult Run(const std::string& code, const std::vector<TestCase>& cases,
                       const ExecutionLimits& limits, const Reporter& reporter = Reporter()) const;

  const JudgeOptions& options() const { return options_; }

 private:
  CaseOutcome RunCase(const std::string& code, const TestCase&, const ExecutionLimits&) const;

  std::shared_ptr<IsolationBackend> backend_;
  JudgeOptions options_;
};

// Deep structural equality: objects by key regardless of order, arrays by position,
// numbers by value (integer 1 equals float 1.0); no tolerance.
bool OutputMatches(const nlohmann::json& actual, const nlohmann::json& expected);

#endif  // INCLUDE_CODEJUDGE_JUDGE_H_
