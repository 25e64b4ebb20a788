#include "runtime/lifecycle_controller.h"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>

namespace heatcast {

// ---------------------------------------------------------------------------
// Graceful shutdown on SIGTERM / SIGINT
// ---------------------------------------------------------------------------

static std::atomic<bool> g_shutdown_requested{false};

static void signalHandler(int sig) {
    // Second signal: exit without draining.
    if (g_shutdown_requested.exchange(true, std::memory_order_relaxed))
        std::_Exit(128 + sig);
}

void LifecycleController::installSignalHandlers() {
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGINT, signalHandler);
}

bool LifecycleController::signalReceived() {
    return g_shutdown_requested.load(std::memory_order_relaxed);
}

void LifecycleController::requestShutdown() {
    requested_.store(true, std::memory_order_relaxed);
}

bool LifecycleController::shutdownRequested() const {
    return requested_.load(std::memory_order_relaxed) || signalReceived();
}

bool LifecycleController::cancel() {
    if (!source_.cancel()) return false;
    std::printf("LifecycleController: shutdown requested, cancelling loops "
                "(signal again to force exit)\n");
    return true;
}

void LifecycleController::waitForShutdown(std::chrono::milliseconds poll) {
    const CancellationToken tok = source_.token();
    while (!shutdownRequested()) {
        if (tok.waitFor(poll)) break;
    }
    cancel();
}

}  // namespace heatcast
