#include "utils.h"

#include <mutex>
#include <condition_variable>

#include "invocation.h"

bool FakeBackend::Probe(std::string& reason) const {
  if (!available_) {
    reason = "fake backend switched off";
    return false;
  }
  return true;
}

RawExecutionResult FakeBackend::Run(const std::string& code, const nlohmann::json& input,
                                    const ExecutionLimits&, ExecutionMonitor& monitor) {
  int call = calls_++;
  if (std::string reason; !Probe(reason)) return RawExecutionResult::Unavailable(reason);
  return script_(call, code, input, monitor);
}

RawExecutionResult Returned(const nlohmann::json& value) {
  RawExecutionResult ret;
  ret.status = RawStatus::EXITED;
  ret.stdout_data = std::string("debug print\n") + kResultMarker + value.dump() + "\n";
  return ret;
}

RawExecutionResult Exited(int exit_code, const std::string& stderr_data) {
  RawExecutionResult ret;
  ret.status = RawStatus::EXITED;
  ret.exit_code = exit_code;
  ret.stderr_data = stderr_data;
  return ret;
}

RawExecutionResult WithStatus(RawStatus status) {
  RawExecutionResult ret;
  ret.status = status;
  if (status == RawStatus::SIGNALED) ret.term_signal = 11;
  return ret;
}

RawExecutionResult HangUntilTerminated(ExecutionMonitor& monitor) {
  std::mutex mtx;
  std::condition_variable cv;
  bool killed = false;
  monitor.SetTerminator([&]() {
    std::lock_guard lck(mtx);
    killed = true;
    cv.notify_all();
  });
  {
    std::unique_lock lck(mtx);
    cv.wait(lck, [&]() { return killed; });
  }
  monitor.ClearTerminator();
  return WithStatus(RawStatus::SIGNALED);
}

FakeBackend::Script AdderScript() {
  return [](int, const std::string&, const nlohmann::json& input, ExecutionMonitor&) {
    return Returned(input.at("a").get<long>() + input.at("b").get<long>());
  };
}

std::vector<TestCase> AdderCases() {
  return {
    {{{"a", 2}, {"b", 3}}, 5},
    {{{"a", 1}, {"b", 1}}, 2},
  };
}
