#include "runtime/cancellation.h"

#include <utility>

namespace heatcast {

CancellationToken::CancellationToken()
    : state_(std::make_shared<CancellationState>()) {}

CancellationToken::CancellationToken(std::shared_ptr<CancellationState> state)
    : state_(std::move(state)) {}

bool CancellationToken::isCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::waitUntil(Clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_until(lock, deadline, [this] { return state_->cancelled; });
}

bool CancellationToken::waitFor(Clock::duration timeout) const {
    return waitUntil(Clock::now() + timeout);
}

void CancellationToken::wait() const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this] { return state_->cancelled; });
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationState>()) {}

bool CancellationSource::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) return false;
        state_->cancelled = true;
    }
    state_->cv.notify_all();
    return true;
}

bool CancellationSource::isCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

}  // namespace heatcast
