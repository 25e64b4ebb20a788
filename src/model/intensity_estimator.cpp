#include "model/intensity_estimator.h"
#include "model/ease.h"
#include "core/errors.h"
#include "core/timestamp.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace heatcast {

IntensityEstimator::IntensityEstimator(int threshold_sec) : threshold_sec_(threshold_sec) {
    if (threshold_sec_ <= 0)
        throw std::invalid_argument("IntensityEstimator: threshold must be positive, got " +
                                    std::to_string(threshold_sec));
}

IntensityEstimate IntensityEstimator::estimate(const EventBatch& batch) const {
    if (batch.size() < 2)
        throw InsufficientDataError("need at least 2 events to form a gap, got " +
                                    std::to_string(batch.size()));

    std::vector<int64_t> times;
    times.reserve(batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
        try {
            times.push_back(parseCreatedAt(batch[i].created_at));
        } catch (const TimestampParseError& e) {
            throw TimestampParseError("event " + std::to_string(i) + " (id=" +
                                      batch[i].id + "): " + e.what());
        }
    }
    return estimateFromTimes(times);
}

IntensityEstimate IntensityEstimator::estimateFromTimes(const std::vector<int64_t>& newest_first) const {
    const size_t n = newest_first.size();
    if (n < 2)
        throw InsufficientDataError("need at least 2 events to form a gap, got " +
                                    std::to_string(n));

    IntensityEstimate est;
    est.event_count = n;

    // Source order is newest-first. Ends in the other order mean oldest-first.
    const bool oldest_first = newest_first.front() < newest_first.back();
    est.reordered = oldest_first;

    // Walk oldest -> newest.
    double sum = 0.0;
    for (size_t k = 0; k + 1 < n; ++k) {
        int64_t prev, next;
        if (oldest_first) {
            prev = newest_first[k];
            next = newest_first[k + 1];
        } else {
            prev = newest_first[n - 1 - k];
            next = newest_first[n - 2 - k];
        }
        const double gap = static_cast<double>(next - prev);
        sum += std::max(0.0, gap);  // out-of-order pair counts as zero
    }

    est.avg_gap_sec = sum / static_cast<double>(n - 1);
    est.ratio = 1.0 - std::min(1.0, est.avg_gap_sec / static_cast<double>(threshold_sec_));

    const double eased = easeInOutCubic(est.ratio) * 100.0;
    const int32_t score = static_cast<int32_t>(eased);
    est.intensity = std::clamp(score, kMinIntensity, kMaxIntensity);
    return est;
}

}  // namespace heatcast
