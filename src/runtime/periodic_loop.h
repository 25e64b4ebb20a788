#pragma once

#include "runtime/cancellation.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace heatcast {

/// Runs a tick function on its own thread at a fixed interval until the
/// token is cancelled.
///
/// Ticker semantics: the first tick fires one interval after start(), and
/// deadlines that pass while a tick is still running are dropped rather than
/// fired back to back. Cancellation is observed at the wait between ticks;
/// a tick already running is never interrupted.
class PeriodicLoop {
public:
    using Clock = std::chrono::steady_clock;
    using TickFn = std::function<void()>;

    PeriodicLoop(std::string name, Clock::duration interval, TickFn tick);

    /// Joins the thread. The token passed to start() must already be
    /// cancelled, otherwise this blocks.
    ~PeriodicLoop();

    PeriodicLoop(const PeriodicLoop&) = delete;
    PeriodicLoop& operator=(const PeriodicLoop&) = delete;

    /// Spawn the loop thread. Throws std::logic_error if already started.
    void start(CancellationToken token);

    /// Wait for the loop thread to exit.
    void join();

    bool running() const { return running_.load(std::memory_order_acquire); }
    uint64_t ticks() const { return ticks_.load(std::memory_order_relaxed); }
    uint64_t skippedTicks() const { return skipped_.load(std::memory_order_relaxed); }
    const std::string& name() const { return name_; }

private:
    void run(CancellationToken token);
    void runTick();

    std::string name_;
    Clock::duration interval_;
    TickFn tick_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> skipped_{0};
};

}  // namespace heatcast
