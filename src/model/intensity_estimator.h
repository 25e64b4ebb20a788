#pragma once

#include "core/event_batch.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace heatcast {

constexpr int32_t kMinIntensity = 0;
constexpr int32_t kMaxIntensity = 100;

struct IntensityEstimate {
    int32_t intensity = 0;      // [0, 100]
    double  avg_gap_sec = 0.0;
    double  ratio = 0.0;        // 1 - min(1, avg_gap / threshold)
    size_t  event_count = 0;
    bool    reordered = false;  // batch arrived oldest-first and was walked in reverse
};

/// Maps the mean inter-event gap of a batch to an eased [0,100] score.
///   ratio     = 1 - min(1, mean(gap) / threshold)
///   intensity = trunc(easeInOutCubic(ratio) * 100)
/// Gaps are clamped at zero, so out-of-order neighbours never push the
/// average below zero. Stateless; safe to share across threads.
class IntensityEstimator {
public:
    /// @param threshold_sec  Mean gap (seconds) at or beyond which intensity is 0.
    ///                       Must be positive.
    explicit IntensityEstimator(int threshold_sec);

    /// Parses every created_at, then estimates.
    /// Throws TimestampParseError or InsufficientDataError; no partial result.
    IntensityEstimate estimate(const EventBatch& batch) const;

    /// Same as estimate() on already-parsed epoch seconds, newest-first.
    IntensityEstimate estimateFromTimes(const std::vector<int64_t>& newest_first) const;

    int thresholdSeconds() const { return threshold_sec_; }

private:
    int threshold_sec_;
};

}  // namespace heatcast
