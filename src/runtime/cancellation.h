#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace heatcast {

/// Shared state behind a CancellationSource and its tokens.
struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
};

/// Read side of a cancellation signal. Cheap to copy; all copies observe
/// the same source. A default-constructed token is never cancelled.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken();
    explicit CancellationToken(std::shared_ptr<CancellationState> state);

    bool isCancelled() const;

    /// Block until deadline or cancellation, whichever comes first.
    /// Returns true if cancelled.
    bool waitUntil(Clock::time_point deadline) const;

    /// Relative form of waitUntil().
    bool waitFor(Clock::duration timeout) const;

    /// Block until cancelled.
    void wait() const;

private:
    std::shared_ptr<CancellationState> state_;
};

/// Write side. cancel() flips the shared state exactly once and wakes every
/// waiter; the transition is irreversible.
class CancellationSource {
public:
    CancellationSource();

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    /// Returns true only for the call that performed the transition.
    bool cancel();

    bool isCancelled() const;
    CancellationToken token() const { return CancellationToken(state_); }

private:
    std::shared_ptr<CancellationState> state_;
};

}  // namespace heatcast
