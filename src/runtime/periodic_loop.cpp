#include "runtime/periodic_loop.h"

#include <cstdio>
#include <exception>
#include <stdexcept>
#include <utility>

namespace heatcast {

PeriodicLoop::PeriodicLoop(std::string name, Clock::duration interval, TickFn tick)
    : name_(std::move(name)), interval_(interval), tick_(std::move(tick))
{
    if (interval_ <= Clock::duration::zero())
        throw std::invalid_argument(name_ + ": interval must be positive");
    if (!tick_)
        throw std::invalid_argument(name_ + ": empty tick function");
}

PeriodicLoop::~PeriodicLoop() {
    join();
}

void PeriodicLoop::start(CancellationToken token) {
    if (thread_.joinable())
        throw std::logic_error(name_ + ": already started");
    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&PeriodicLoop::run, this, std::move(token));
}

void PeriodicLoop::join() {
    if (thread_.joinable())
        thread_.join();
}

void PeriodicLoop::run(CancellationToken token) {
    auto next = Clock::now() + interval_;

    while (!token.waitUntil(next)) {
        runTick();

        next += interval_;
        const auto now = Clock::now();
        while (next <= now) {
            next += interval_;
            skipped_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    running_.store(false, std::memory_order_release);
    std::printf("%s: stopped after %llu ticks\n", name_.c_str(),
                static_cast<unsigned long long>(ticks()));
}

void PeriodicLoop::runTick() {
    ticks_.fetch_add(1, std::memory_order_relaxed);
    try {
        tick_();
    } catch (const std::exception& e) {
        std::fprintf(stderr, "%s: tick failed: %s\n", name_.c_str(), e.what());
    }
}

}  // namespace heatcast
