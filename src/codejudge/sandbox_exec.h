#ifndef CODEJUDGE_SANDBOX_EXEC_H_
#define CODEJUDGE_SANDBOX_EXEC_H_

#include <codejudge/backend.h>
#include "sandbox.h"

// Kept apart from sandbox.h because this needs logging and process helpers,
//   while sandbox.h is also linked into the sandbox-exec helper

// before SandboxExec:
// 1. create the box dir with a writable workdir inside
// 2. take a uid/gid (and CPUs if pinning) that no other running box uses
// 3. put the payload file into workdir, readable by that uid
// timekill == -1 in the result means the sandbox itself failed; oomkill then holds errno
// a helper killed by its own deadline or the monitor is reported as a time kill
struct cjail_result SandboxExec(const SandboxOptions&, ExecutionMonitor& monitor);

// Maps a cjail_result to a RawStatus; stdout/stderr are left to the caller
RawExecutionResult ClassifyCJailResult(const struct cjail_result&);

#endif  // CODEJUDGE_SANDBOX_EXEC_H_
