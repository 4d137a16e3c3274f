// signals.cpp - Signal handling and shared shutdown flag.

#include "system/signals.hpp"

#include <csignal>

namespace updater {

std::atomic_bool g_shutdown{false};

static void HandleSignal(int) {
    g_shutdown.store(true, std::memory_order_relaxed);
}

void InstallSignalHandlers() {
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    // stdout is the progress channel; a closed reader must not kill the daemon.
    std::signal(SIGPIPE, SIG_IGN);
}

} // namespace updater
