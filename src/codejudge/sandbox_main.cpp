#include <errno.h>
#include <unistd.h>
#include <iostream>
#include <iterator>

#include <nlohmann/json.hpp>
#include "sandbox.h"

namespace {

struct cjail_result SandboxExec(const SandboxOptions& opt) {
  CJailCtxClass ctx;
  opt.ToCJailCtx(ctx);
  struct cjail_result ret = {};
  if (cjail_exec(&ctx.GetCtx(), &ret) < 0) {
    ret.oomkill = errno;
    ret.timekill = -1;
  }
  return ret;
}

bool WriteAll(const void* buf, size_t len) {
  const char* ptr = static_cast<const char*>(buf);
  while (len) {
    ssize_t n = write(1, ptr, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n;
    len -= n;
  }
  return true;
}

} // namespace

// reads SandboxOptions as JSON from stdin, writes the raw cjail_result to stdout
int main() {
  std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
  SandboxOptions opt;
  try {
    opt = SandboxOptions(nlohmann::json::parse(input));
  } catch (nlohmann::json::exception& e) {
    std::cerr << "invalid sandbox options: " << e.what() << std::endl;
    return 1;
  }
  struct cjail_result res = SandboxExec(opt);
  if (!WriteAll(&res, sizeof(res))) return 1;
}
