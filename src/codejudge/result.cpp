#include <codejudge/judge.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "utils.h"

SubmissionResult SubmissionResult::Aggregate(std::vector<CaseOutcome>&& outcomes) {
  SubmissionResult ret;
  ret.case_outcomes_ = std::move(outcomes);
  bool any_unavailable = false, any_failed = false;
  int first_error = -1;
  for (size_t i = 0; i < ret.case_outcomes_.size(); i++) {
    switch (ret.case_outcomes_[i].status) {
      case CaseStatus::PASSED: ret.passed_count_++; break;
      case CaseStatus::FAILED: [[fallthrough]];
      case CaseStatus::TIMEOUT: any_failed = true; break;
      case CaseStatus::ERROR: if (first_error == -1) first_error = i; break;
      case CaseStatus::BACKEND_UNAVAILABLE: any_unavailable = true; break;
    }
  }
  if (ret.case_outcomes_.empty()) {
    ret.overall_status_ = OverallStatus::FAILED;
    ret.message_ = "No test cases";
  } else if (any_unavailable) {
    ret.overall_status_ = OverallStatus::WARNING;
    ret.message_ = "Using mock execution";
  } else if (first_error != -1) {
    ret.overall_status_ = OverallStatus::ERROR;
    ret.message_ = fmt::format("Error in test case {}: {}", first_error,
                               ret.case_outcomes_[first_error].message);
  } else if (any_failed) {
    ret.overall_status_ = OverallStatus::FAILED;
    ret.message_ = fmt::format("{}/{} test cases passed", ret.passed_count_, ret.total_count());
  } else {
    ret.overall_status_ = OverallStatus::PASSED;
    ret.message_ = "All test cases passed";
  }
  return ret;
}

bool OutputMatches(const nlohmann::json& actual, const nlohmann::json& expected) {
  // objects are ordered maps, and numbers of different kinds compare by value
  return actual == expected;
}

bool ParseTestCases(const std::string& text, std::vector<TestCase>& cases, std::string& error) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text);
  } catch (nlohmann::json::parse_error& e) {
    spdlog::info("Test cases parse error: {}", e.what());
    error = "Invalid test cases JSON format";
    return false;
  }
  if (!j.is_array()) {
    error = "Invalid test cases JSON format";
    return false;
  }
  std::vector<TestCase> ret;
  for (auto& item : j) {
    if (!item.is_object()) {
      error = "Invalid test cases JSON format";
      return false;
    }
    TestCase test_case;
    auto input = item.find("input");
    test_case.input = input != item.end() ? *input : nlohmann::json::object();
    auto output = item.find("output");
    if (output != item.end()) test_case.expected_output = *output;
    ret.push_back(std::move(test_case));
  }
  cases = std::move(ret);
  return true;
}

nlohmann::json ResultToJson(const SubmissionResult& result, const std::vector<TestCase>& cases) {
  nlohmann::json test_results = nlohmann::json::array();
  nlohmann::json failed_cases = nlohmann::json::array();
  nlohmann::json first_error;
  const auto& outcomes = result.case_outcomes();
  for (size_t i = 0; i < outcomes.size(); i++) {
    const CaseOutcome& outcome = outcomes[i];
    nlohmann::json item = {
      {"test_case", i},
      {"status", CaseStatusName(outcome.status)},
      {"duration_ms", outcome.duration_ms},
    };
    if (outcome.status == CaseStatus::PASSED) {
      item["output"] = outcome.actual_output.value_or(nullptr);
    } else {
      failed_cases.push_back(i);
    }
    if (outcome.status == CaseStatus::FAILED) {
      item["got"] = outcome.actual_output.value_or(nullptr);
      if (i < cases.size()) item["expected"] = cases[i].expected_output;
    }
    if (!outcome.message.empty()) item["error"] = outcome.message;
    if (outcome.stderr_excerpt) item["stderr"] = *outcome.stderr_excerpt;
    if (outcome.status == CaseStatus::ERROR && first_error.is_null()) {
      first_error = outcome.stderr_excerpt ? *outcome.stderr_excerpt : outcome.message;
    }
    test_results.push_back(std::move(item));
  }
  return {
    {"status", OverallStatusName(result.overall_status())},
    {"message", result.message()},
    {"passed", result.passed_count()},
    {"total", result.total_count()},
    {"test_results", std::move(test_results)},
    {"failed_cases", std::move(failed_cases)},
    {"first_error", std::move(first_error)},
  };
}
