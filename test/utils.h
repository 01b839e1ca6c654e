#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <atomic>
#include <string>
#include <functional>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <codejudge/judge.h>
#include <codejudge/backend.h>

// Backend whose behavior is scripted per call; counts how often it is launched.
class FakeBackend : public IsolationBackend {
 public:
  // call is the 0-based index of the Run() call
  using Script = std::function<RawExecutionResult(int call, const std::string& code,
                                                  const nlohmann::json& input, ExecutionMonitor&)>;

  explicit FakeBackend(Script script) : script_(std::move(script)), available_(true), calls_(0) {}

  const char* Name() const override { return "fake"; }
  bool Probe(std::string& reason) const override;
  RawExecutionResult Run(const std::string& code, const nlohmann::json& input,
                         const ExecutionLimits& limits, ExecutionMonitor& monitor) override;

  void set_available(bool available) { available_ = available; }
  int calls() const { return calls_; }

 private:
  Script script_;
  std::atomic_bool available_;
  std::atomic_int calls_;
};

// clean exit printing some noise followed by the result line
RawExecutionResult Returned(const nlohmann::json& value);
RawExecutionResult Exited(int exit_code, const std::string& stderr_data = "");
RawExecutionResult WithStatus(RawStatus status);
// blocks until the monitor is terminated, then reports a kill
RawExecutionResult HangUntilTerminated(ExecutionMonitor& monitor);

// returns input["a"] + input["b"]
FakeBackend::Script AdderScript();

std::vector<TestCase> AdderCases();

#endif // TEST_UTILS_H_
