#pragma once

#include "runtime/cancellation.h"

#include <atomic>
#include <chrono>

namespace heatcast {

/// Owns the process-wide cancellation source and turns SIGINT/SIGTERM into
/// one irreversible cancel. The signal handler only raises an atomic flag;
/// the main thread notices it in waitForShutdown() and performs the cancel.
///
/// The signal flag belongs to the process and is never reset: once a signal
/// has arrived, every controller's waitForShutdown() returns at once. A
/// second signal terminates the process immediately with status 128+sig.
/// requestShutdown() only affects the controller it is called on.
class LifecycleController {
public:
    LifecycleController() = default;

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    /// Route SIGINT and SIGTERM to the process-wide shutdown flag.
    static void installSignalHandlers();

    /// True once SIGINT or SIGTERM has been received.
    static bool signalReceived();

    /// Asks this controller's waitForShutdown() to return. Safe from any thread.
    void requestShutdown();

    /// requestShutdown() was called on this controller or a signal arrived.
    bool shutdownRequested() const;

    CancellationToken token() const { return source_.token(); }

    /// Cancel the shared context. Only the first call has an effect;
    /// returns true for that call.
    bool cancel();

    bool isCancelled() const { return source_.isCancelled(); }

    /// Block until a shutdown is requested or the context is cancelled by
    /// another path, then make sure it is cancelled.
    void waitForShutdown(std::chrono::milliseconds poll = std::chrono::milliseconds(100));

private:
    CancellationSource source_;
    std::atomic<bool> requested_{false};
};

}  // namespace heatcast
