#include <cmath>
#include <chrono>
#include <climits>
#include <limits>
#include <optional>
#include <thread>
#include <stdexcept>
#include <sys/sysinfo.h>
#include <codejudge/utils.h>

#include "utils.h"
#include "invocation.h"

namespace {

using Clock = std::chrono::steady_clock;

const ExecutionLimits kLimits(2, 256, 0.5);

std::vector<CaseStatus> Statuses(const SubmissionResult& res) {
  std::vector<CaseStatus> ret;
  for (auto& i : res.case_outcomes()) ret.push_back(i.status);
  return ret;
}

} // namespace

TEST(JudgeTest, EmptyCasesFail) {
  auto backend = std::make_shared<FakeBackend>(AdderScript());
  Judge judge(backend);
  SubmissionResult res = judge.Run("code", {}, kLimits);
  EXPECT_EQ(res.overall_status(), OverallStatus::FAILED);
  EXPECT_EQ(res.passed_count(), 0);
  EXPECT_EQ(res.total_count(), 0);
  EXPECT_EQ(backend->calls(), 0);
}

TEST(JudgeTest, AdderPasses) {
  auto backend = std::make_shared<FakeBackend>(AdderScript());
  Judge judge(backend);
  SubmissionResult res = judge.Run("def solution(a, b): return a + b", AdderCases(), kLimits);
  EXPECT_EQ(res.overall_status(), OverallStatus::PASSED);
  EXPECT_EQ(res.passed_count(), 2);
  EXPECT_EQ(res.total_count(), 2);
  EXPECT_EQ(res.message(), "All test cases passed");
  ASSERT_TRUE(res.case_outcomes()[0].actual_output);
  EXPECT_EQ(*res.case_outcomes()[0].actual_output, 5);
  EXPECT_EQ(backend->calls(), 2);
}

TEST(JudgeTest, AdderWithoutBackendWarns) {
  auto backend = std::make_shared<FakeBackend>(AdderScript());
  backend->set_available(false);
  Judge judge(backend);
  SubmissionResult res = judge.Run("def solution(a, b): return a + b", AdderCases(), kLimits);
  EXPECT_EQ(res.overall_status(), OverallStatus::WARNING);
  EXPECT_EQ(res.passed_count(), 0);
  EXPECT_EQ(res.total_count(), 2);
  EXPECT_EQ(res.message(), "Using mock execution");
  for (auto& i : res.case_outcomes()) {
    EXPECT_EQ(i.status, CaseStatus::BACKEND_UNAVAILABLE);
    EXPECT_FALSE(i.actual_output);
  }
}

TEST(JudgeTest, FallbackIsSticky) {
  auto backend = std::make_shared<FakeBackend>(AdderScript());
  backend->set_available(false);
  Judge judge(backend);
  std::vector<TestCase> cases(5, {{{"a", 1}, {"b", 2}}, 3});
  SubmissionResult res = judge.Run("code", cases, kLimits);
  EXPECT_EQ(backend->calls(), 1);
  EXPECT_EQ(Statuses(res), std::vector<CaseStatus>(5, CaseStatus::BACKEND_UNAVAILABLE));
  // the remaining cases keep the reason of the first one
  EXPECT_EQ(res.case_outcomes()[4].message, "fake backend switched off");
}

TEST(JudgeTest, FallbackAfterPassWarns) {
  auto backend = std::make_shared<FakeBackend>(
      [](int call, const std::string&, const nlohmann::json& input, ExecutionMonitor&) {
        return call == 0 ? Returned(input) : RawExecutionResult::Unavailable("daemon went away");
      });
  Judge judge(backend);
  std::vector<TestCase> cases = {{1, 1}, {2, 2}, {3, 3}};
  SubmissionResult res = judge.Run("code", cases, kLimits);
  EXPECT_EQ(res.overall_status(), OverallStatus::WARNING);
  EXPECT_EQ(res.passed_count(), 1);
  EXPECT_EQ(backend->calls(), 2);
  EXPECT_EQ(Statuses(res), (std::vector<CaseStatus>{
      CaseStatus::PASSED, CaseStatus::BACKEND_UNAVAILABLE, CaseStatus::BACKEND_UNAVAILABLE}));
}

TEST(JudgeTest, ErrorOutranksFailed) {
  auto backend = std::make_shared<FakeBackend>(
      [](int call, const std::string&, const nlohmann::json& input, ExecutionMonitor&) {
        switch (call) {
          case 0: return Returned(input);
          case 1: return Exited(1, "Traceback (most recent call last):\nZeroDivisionError");
          default: return Returned("wrong");
        }
      });
  Judge judge(backend);
  std::vector<TestCase> cases = {{1, 1}, {2, 2}, {3, 3}};
  SubmissionResult res = judge.Run("code", cases, kLimits);
  EXPECT_EQ(res.overall_status(), OverallStatus::ERROR);
  EXPECT_EQ(res.passed_count(), 1);
  EXPECT_EQ(Statuses(res), (std::vector<CaseStatus>{
      CaseStatus::PASSED, CaseStatus::ERROR, CaseStatus::FAILED}));
  const CaseOutcome& err = res.case_outcomes()[1];
  ASSERT_TRUE(err.stderr_excerpt);
  EXPECT_NE(err.stderr_excerpt->find("ZeroDivisionError"), std::string::npos);
  EXPECT_EQ(err.message, "Exited with code 1");
}

TEST(JudgeTest, TimeoutCountsAsFailed) {
  auto backend = std::make_shared<FakeBackend>(
      [](int call, const std::string&, const nlohmann::json& input, ExecutionMonitor&) {
        return call == 0 ? WithStatus(RawStatus::TIMEOUT) : Returned(input);
      });
  Judge judge(backend);
  SubmissionResult res = judge.Run("code", {{1, 1}, {2, 2}}, kLimits);
  EXPECT_EQ(res.overall_status(), OverallStatus::FAILED);
  EXPECT_EQ(Statuses(res), (std::vector<CaseStatus>{CaseStatus::TIMEOUT, CaseStatus::PASSED}));
  EXPECT_EQ(res.message(), "1/2 test cases passed");
}

TEST(JudgeTest, OrderIsPreserved) {
  auto backend = std::make_shared<FakeBackend>(
      [](int, const std::string&, const nlohmann::json& input, ExecutionMonitor&) {
        return Returned(input.get<int>() * 2);
      });
  Judge judge(backend);
  std::vector<TestCase> cases;
  for (int i = 0; i < 8; i++) cases.push_back({i, i % 3 == 0 ? i * 2 : -1});
  SubmissionResult res = judge.Run("code", cases, kLimits);
  ASSERT_EQ(res.total_count(), 8);
  for (int i = 0; i < 8; i++) {
    EXPECT_EQ(res.case_outcomes()[i].status, i % 3 == 0 ? CaseStatus::PASSED : CaseStatus::FAILED) << i;
    EXPECT_EQ(*res.case_outcomes()[i].actual_output, i * 2);
  }
  EXPECT_EQ(res.passed_count(), 3);
}

TEST(JudgeTest, ExecutionFailuresAreErrors) {
  std::vector<RawExecutionResult> raws = {
    WithStatus(RawStatus::SIGNALED),
    WithStatus(RawStatus::MEMORY_EXCEEDED),
    WithStatus(RawStatus::OUTPUT_EXCEEDED),
    RawExecutionResult::SandboxError("no free slot"),
    Exited(0), // no result line at all
  };
  auto backend = std::make_shared<FakeBackend>(
      [&raws](int call, const std::string&, const nlohmann::json&, ExecutionMonitor&) {
        return raws[call];
      });
  Judge judge(backend);
  std::vector<TestCase> cases(raws.size(), {1, 1});
  SubmissionResult res = judge.Run("code", cases, kLimits);
  EXPECT_EQ(res.overall_status(), OverallStatus::ERROR);
  EXPECT_EQ(Statuses(res), std::vector<CaseStatus>(raws.size(), CaseStatus::ERROR));
  EXPECT_EQ(res.case_outcomes()[0].message, "Killed by signal 11");
  EXPECT_EQ(res.case_outcomes()[1].message, "Memory limit exceeded (256 MB)");
  EXPECT_EQ(res.case_outcomes()[3].message, "Sandbox error: no free slot");
  EXPECT_EQ(res.message(), "Error in test case 0: Killed by signal 11");
}

TEST(JudgeTest, MalformedResultLineIsError) {
  auto backend = std::make_shared<FakeBackend>(
      [](int call, const std::string&, const nlohmann::json&, ExecutionMonitor&) {
        RawExecutionResult raw = Exited(0);
        // a marker in the middle of stdout is not authoritative
        if (call == 0) raw.stdout_data = Returned(1).stdout_data + "trailing noise\n";
        if (call == 1) raw.stdout_data = std::string("noise\n") + kResultMarker + "{broken\n";
        return raw;
      });
  Judge judge(backend);
  SubmissionResult res = judge.Run("code", {{1, 1}, {1, 1}}, kLimits);
  EXPECT_EQ(Statuses(res), (std::vector<CaseStatus>{CaseStatus::ERROR, CaseStatus::ERROR}));
  EXPECT_FALSE(res.case_outcomes()[0].actual_output);
}

TEST(JudgeTest, StderrExcerptIsBounded) {
  auto backend = std::make_shared<FakeBackend>(
      [](int, const std::string&, const nlohmann::json&, ExecutionMonitor&) {
        return Exited(1, std::string(10000, 'x'));
      });
  JudgeOptions options;
  options.max_stderr_bytes = 100;
  Judge judge(backend, options);
  SubmissionResult res = judge.Run("code", {{1, 1}}, kLimits);
  const auto& excerpt = res.case_outcomes()[0].stderr_excerpt;
  ASSERT_TRUE(excerpt);
  EXPECT_EQ(excerpt->substr(0, 100), std::string(100, 'x'));
  EXPECT_EQ(excerpt->substr(100), "\n[Output truncated after 100 bytes]");
}

TEST(JudgeTest, InvalidLimitsDoNotLaunch) {
  auto backend = std::make_shared<FakeBackend>(AdderScript());
  Judge judge(backend);
  const double inf = std::numeric_limits<double>::infinity();
  for (auto& limits : {ExecutionLimits(0, 256, 0.5), ExecutionLimits(1, -1, 0.5),
                       ExecutionLimits(1, 256, 0), ExecutionLimits(1, 256, get_nprocs() + 1.0),
                       ExecutionLimits(NAN, 256, 0.5), ExecutionLimits(inf, 256, 0.5),
                       ExecutionLimits(1e300, 256, 0.5), ExecutionLimits(1, LONG_MAX - 1, 0.5),
                       ExecutionLimits(1, 256, NAN), ExecutionLimits(1, 256, inf)}) {
    SubmissionResult res = judge.Run("code", AdderCases(), limits);
    EXPECT_EQ(res.overall_status(), OverallStatus::ERROR);
    EXPECT_EQ(Statuses(res), std::vector<CaseStatus>(2, CaseStatus::ERROR));
    EXPECT_EQ(res.case_outcomes()[0].message.rfind("Invalid execution limits: ", 0), 0u);
  }
  EXPECT_EQ(backend->calls(), 0);
}

TEST(JudgeTest, BackendExceptionIsError) {
  auto backend = std::make_shared<FakeBackend>(
      [](int, const std::string&, const nlohmann::json&, ExecutionMonitor&) -> RawExecutionResult {
        throw std::runtime_error("boom");
      });
  Judge judge(backend);
  SubmissionResult res = judge.Run("code", {{1, 1}}, kLimits);
  EXPECT_EQ(res.overall_status(), OverallStatus::ERROR);
  EXPECT_EQ(res.case_outcomes()[0].message, "Internal error: boom");
}

TEST(JudgeTest, NonStandardExceptionIsError) {
  auto backend = std::make_shared<FakeBackend>(
      [](int, const std::string&, const nlohmann::json&, ExecutionMonitor&) -> RawExecutionResult {
        throw 42;
      });
  Judge judge(backend);
  SubmissionResult res = judge.Run("code", {{1, 1}}, kLimits);
  EXPECT_EQ(res.overall_status(), OverallStatus::ERROR);
  EXPECT_EQ(res.case_outcomes()[0].message, "Internal error: unknown exception");
}

TEST(JudgeTest, ThrowingReporterDoesNotStopJudging) {
  auto backend = std::make_shared<FakeBackend>(AdderScript());
  Judge judge(backend);
  int reported = 0;
  Judge::Reporter reporter;
  reporter.ReportStateChange = [](JudgeState, JudgeState) { throw std::runtime_error("down"); };
  reporter.ReportCaseResult = [&](size_t, const CaseOutcome&) {
    reported++;
    throw 1;
  };
  reporter.ReportOverallResult = [](const SubmissionResult&) { throw std::logic_error("down"); };
  std::optional<SubmissionResult> res;
  EXPECT_NO_THROW(res.emplace(judge.Run("code", AdderCases(), kLimits, reporter)));
  ASSERT_TRUE(res);
  EXPECT_EQ(res->overall_status(), OverallStatus::PASSED);
  EXPECT_EQ(reported, 2);
  EXPECT_EQ(backend->calls(), 2);
}

TEST(JudgeTest, NoBackendWarns) {
  Judge judge(nullptr);
  SubmissionResult res = judge.Run("code", AdderCases(), kLimits);
  EXPECT_EQ(res.overall_status(), OverallStatus::WARNING);
  EXPECT_EQ(res.total_count(), 2);
}

TEST(JudgeTest, ReporterSeesEveryTransition) {
  auto backend = std::make_shared<FakeBackend>(
      [](int call, const std::string&, const nlohmann::json& input, ExecutionMonitor&) {
        return call == 0 ? Returned(input) : RawExecutionResult::Unavailable("gone");
      });
  Judge judge(backend);
  std::vector<std::pair<JudgeState, JudgeState>> transitions;
  std::vector<size_t> indices;
  int overall = 0;
  Judge::Reporter reporter;
  reporter.ReportStateChange = [&](JudgeState from, JudgeState to) { transitions.emplace_back(from, to); };
  reporter.ReportCaseResult = [&](size_t index, const CaseOutcome&) { indices.push_back(index); };
  reporter.ReportOverallResult = [&](const SubmissionResult& res) {
    EXPECT_EQ(res.overall_status(), OverallStatus::WARNING);
    overall++;
  };
  judge.Run("code", {{1, 1}, {2, 2}, {3, 3}}, kLimits, reporter);
  EXPECT_EQ(transitions, (std::vector<std::pair<JudgeState, JudgeState>>{
      {JudgeState::NOT_STARTED, JudgeState::RUNNING},
      {JudgeState::RUNNING, JudgeState::FALLBACK},
      {JudgeState::FALLBACK, JudgeState::COMPLETED}}));
  EXPECT_EQ(indices, (std::vector<size_t>{0, 1, 2}));
  EXPECT_EQ(overall, 1);
}

TEST(JudgeTest, SupervisorTerminatesHungBackend) {
  auto backend = std::make_shared<FakeBackend>(
      [](int, const std::string&, const nlohmann::json&, ExecutionMonitor& monitor) {
        return HangUntilTerminated(monitor);
      });
  JudgeOptions options;
  options.supervisor_margin_seconds = 0.1;
  options.terminate_grace_seconds = 2;
  Judge judge(backend, options);
  auto start = Clock::now();
  SubmissionResult res = judge.Run("while True: pass", {{1, 1}, {2, 2}}, ExecutionLimits(0.2, 256, 0.5));
  auto elapsed = Clock::now() - start;
  EXPECT_EQ(res.overall_status(), OverallStatus::FAILED);
  EXPECT_EQ(Statuses(res), std::vector<CaseStatus>(2, CaseStatus::TIMEOUT));
  EXPECT_EQ(res.case_outcomes()[0].message, "Timeout exceeded (0.2s)");
  EXPECT_GE(res.case_outcomes()[0].duration_ms, 300);
  EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(JudgeTest, SupervisorAbandonsUnresponsiveBackend) {
  auto backend = std::make_shared<FakeBackend>(
      [](int, const std::string&, const nlohmann::json& input, ExecutionMonitor&) {
        // ignores termination entirely
        std::this_thread::sleep_for(std::chrono::seconds(2));
        return Returned(input);
      });
  JudgeOptions options;
  options.supervisor_margin_seconds = 0.1;
  options.terminate_grace_seconds = 0.1;
  Judge judge(backend, options);
  auto start = Clock::now();
  SubmissionResult res = judge.Run("code", {{1, 1}}, ExecutionLimits(0.1, 256, 0.5));
  EXPECT_LT(Clock::now() - start, std::chrono::milliseconds(1500));
  EXPECT_EQ(res.case_outcomes()[0].status, CaseStatus::TIMEOUT);
  EXPECT_EQ(res.overall_status(), OverallStatus::FAILED);
}

TEST(JudgeTest, ConcurrentSubmissionsAreIndependent) {
  auto backend = std::make_shared<FakeBackend>(AdderScript());
  Judge judge(backend);
  std::vector<std::thread> threads;
  std::vector<OverallStatus> statuses(4, OverallStatus::ERROR);
  for (int i = 0; i < 4; i++) {
    threads.emplace_back([&, i]() {
      statuses[i] = judge.Run("code", AdderCases(), kLimits).overall_status();
    });
  }
  for (auto& i : threads) i.join();
  EXPECT_EQ(statuses, std::vector<OverallStatus>(4, OverallStatus::PASSED));
  EXPECT_EQ(backend->calls(), 8);
}
