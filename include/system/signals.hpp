#pragma once

#include <atomic>

namespace updater {

// Set by SIGINT/SIGTERM.
extern std::atomic_bool g_shutdown;

void InstallSignalHandlers();

} // namespace updater
