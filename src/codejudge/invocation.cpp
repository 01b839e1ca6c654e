#include "invocation.h"

#include <cstring>

#include <nlohmann/json.hpp>

const char kResultMarker[] = "@@codejudge-result@@ ";

namespace {

// argv[1] is the entry point name
constexpr char kBootstrapHead[] = R"(import json, sys
_out = sys.stdout
_payload = json.loads(sys.stdin.read())
sys.stdin.close()
_scope = {"__name__": "__submission__", "__builtins__": __builtins__}
exec(compile(_payload["code"], "<submission>", "exec"), _scope)
_entry = _scope.get(sys.argv[1])
if not callable(_entry):
    sys.stderr.write("entry point %r is not defined\n" % sys.argv[1])
    sys.exit(2)
_input = _payload["input"]
if isinstance(_input, dict):
    _result = _entry(**_input)
elif isinstance(_input, list):
    _result = _entry(*_input)
else:
    _result = _entry(_input)
def _check_ints(v):
    if isinstance(v, bool):
        return
    if isinstance(v, int):
        if not -2**63 <= v < 2**64:
            raise OverflowError("integer in result does not fit in 64 bits")
    elif isinstance(v, dict):
        for x in v.values():
            _check_ints(x)
    elif isinstance(v, (list, tuple)):
        for x in v:
            _check_ints(x)
_check_ints(_result)
_line = json.dumps(_result, allow_nan=False)
_out.flush()
_out.write("\n" + ")";
constexpr char kBootstrapTail[] = R"(" + _line + "\n")
_out.flush()
)";

} // namespace

std::vector<std::string> InvocationCommand(const std::string& python, const InvocationOptions& opt) {
  std::string script = std::string(kBootstrapHead) + kResultMarker + kBootstrapTail;
  return {python, "-c", script, opt.entry_point};
}

std::string InvocationPayload(const std::string& code, const nlohmann::json& input) {
  nlohmann::json payload = {{"code", code}, {"input", input}};
  // invalid UTF-8 in the code becomes U+FFFD instead of failing the whole case
  return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool ParseResultLine(const std::string& stdout_data, nlohmann::json& value, std::string& error) {
  size_t end = stdout_data.find_last_not_of(" \t\r\n");
  if (end == std::string::npos) {
    error = "no result was printed";
    return false;
  }
  size_t begin = stdout_data.rfind('\n', end);
  begin = begin == std::string::npos ? 0 : begin + 1;
  std::string line = stdout_data.substr(begin, end - begin + 1);
  const size_t marker_len = strlen(kResultMarker);
  if (line.compare(0, marker_len, kResultMarker) != 0) {
    error = "last line of output is not a result line";
    return false;
  }
  try {
    value = nlohmann::json::parse(line.substr(marker_len));
  } catch (nlohmann::json::parse_error& e) {
    error = std::string("malformed result: ") + e.what();
    return false;
  }
  return true;
}
