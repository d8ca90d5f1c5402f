#pragma once

#include <atomic>

#include <sys/types.h>

namespace uploader {

// Set by the first SIGINT/SIGTERM. The upload loop stops before starting the
// next asset and the run exits nonzero.
extern std::atomic_bool g_cancel;

// A second SIGINT/SIGTERM is forwarded to the registered child process group,
// then terminates the uploader with the default action.
void InstallSignalHandlers();

// Process group of the external command in flight; 0 clears it.
void SetForegroundChild(pid_t pgid);

} // namespace uploader
