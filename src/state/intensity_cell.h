#pragma once

#include <atomic>
#include <cstdint>

namespace heatcast {

/// Single-slot holder for the latest intensity, or absent.
/// One writer (the sampler) and any number of readers. Both sides are a
/// single lock-free atomic access, so neither ever waits on the other.
class IntensityCell {
public:
    IntensityCell() = default;

    IntensityCell(const IntensityCell&) = delete;
    IntensityCell& operator=(const IntensityCell&) = delete;

    /// Replace the current content. Last write wins. Negative values are
    /// stored as 0, so a store never makes the cell absent again.
    void store(int32_t value) {
        value_.store(value < 0 ? 0 : value, std::memory_order_release);
    }

    /// Copy the current content into value. Returns false (value untouched)
    /// while nothing has been stored yet.
    bool load(int32_t& value) const {
        const int32_t v = value_.load(std::memory_order_acquire);
        if (v == kAbsent) return false;
        value = v;
        return true;
    }

    bool hasValue() const {
        return value_.load(std::memory_order_acquire) != kAbsent;
    }

private:
    // Intensities are never negative, so -1 can mark "absent".
    static constexpr int32_t kAbsent = -1;

    std::atomic<int32_t> value_{kAbsent};
    static_assert(std::atomic<int32_t>::is_always_lock_free,
                  "IntensityCell requires a lock-free int32 atomic");
};

}  // namespace heatcast
