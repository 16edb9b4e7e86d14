#ifndef SANDBOX_EXEC_H_
#define SANDBOX_EXEC_H_

#include "sandbox.h"

// Kept apart from sandbox.h, which is linked into the small ibench-sandbox helper.

// Runs opt through the ibench-sandbox helper and waits for it.
// Before calling:
//   1. the box directory exists, root-owned and not writable by uid
//   2. every directory of opt.dirs exists inside the box
//   3. output/error files exist inside the box and are writable by uid
// On failure of the helper itself, timekill is -1 and oomkill holds errno.
struct cjail_result SandboxExec(const SandboxOptions&);

#endif  // SANDBOX_EXEC_H_
