#ifndef SANDBOX_EXEC_H_
#define SANDBOX_EXEC_H_

#include "sandbox.h"

class CancelToken;

// We separate this from sandbox.h because this function needs libcodnite and other logging functions,
//   while we need to keep sandbox.h as small as possible (it is linked into sandbox-exec)

// before SandboxExec:
// 1. create the box dir and its workdir
// 2. lease a unique uid&gid for the submission
// 3. mount a tmpfs with proper size (output limit) onto workdir,
//    set workdir to be writable by uid, and set input/output/error file all inside workdir
// The helper runs in its own process group; if token is cancelled while running,
//   the whole group is killed and the result has timekill = -1, oomkill = ECANCELED.
struct cjail_result SandboxExec(const SandboxOptions&, const CancelToken* token = nullptr);

#endif  // SANDBOX_EXEC_H_
