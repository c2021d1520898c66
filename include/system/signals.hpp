#pragma once

#include <atomic>

namespace centy {

// Set by SIGINT/SIGTERM; long-running transfers poll it and abort.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();
// Back to SIG_DFL once nothing polls g_cancel any more.
void RestoreDefaultSignalHandlers();

} // namespace centy
