#ifndef INCLUDE_CODEJUDGE_UTILS_H_
#define INCLUDE_CODEJUDGE_UTILS_H_

#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>
#include "judge.h"
#include "backend.h"

// unique in a process; used to name boxes and containers
long GetUniqueRunId();

const char* CaseStatusName(CaseStatus);
const char* OverallStatusName(OverallStatus);
// for persistence; returns false if str is not in the closed vocabulary
bool ParseOverallStatus(const std::string& str, OverallStatus& status);

// logging
const char* JudgeStateName(JudgeState);
const char* RawStatusName(RawStatus);

// Parses a stored test case payload: [{"input": ..., "output": ...}, ...]
// "input" defaults to {} and "output" to null.
bool ParseTestCases(const std::string& text, std::vector<TestCase>& cases, std::string& error);

// Structured blob persisted alongside the submission record
nlohmann::json ResultToJson(const SubmissionResult&, const std::vector<TestCase>& cases);

#endif  // INCLUDE_CODEJUDGE_UTILS_H_
