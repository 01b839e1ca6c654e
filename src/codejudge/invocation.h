#ifndef CODEJUDGE_INVOCATION_H_
#define CODEJUDGE_INVOCATION_H_

#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>
#include <codejudge/backend.h>

// Calling convention with the submitted code:
// the interpreter runs a fixed bootstrap script (-c) that reads one JSON object
// {"code": ..., "input": ...} from stdin, executes the code, calls the entry point
// with **input (object), *input (array) or input (anything else) and prints
// kResultMarker followed by the JSON-encoded return value as the last line of stdout.
// Integers outside [-2^63, 2^64) fail the run, since they would be parsed back as doubles.
// Anything else on stdout is diagnostic only.
extern const char kResultMarker[];

std::vector<std::string> InvocationCommand(const std::string& python, const InvocationOptions&);
std::string InvocationPayload(const std::string& code, const nlohmann::json& input);

// Extracts the return value from captured stdout.
// Returns false with a reason if the last non-empty line is not a well-formed result line.
bool ParseResultLine(const std::string& stdout_data, nlohmann::json& value, std::string& error);

#endif  // CODEJUDGE_INVOCATION_H_
