#include "relay/sampler_loop.h"
#include "core/errors.h"

#include <cstdio>
#include <exception>
#include <utility>

namespace heatcast {

const char* toString(SampleOutcome outcome) {
    switch (outcome) {
        case SampleOutcome::UPDATED:           return "updated";
        case SampleOutcome::SOURCE_ERROR:      return "source_error";
        case SampleOutcome::PARSE_ERROR:       return "parse_error";
        case SampleOutcome::INSUFFICIENT_DATA: return "insufficient_data";
        default:                               return "unknown";
    }
}

SamplerLoop::SamplerLoop(IEventSource& source,
                         const IntensityEstimator& estimator,
                         IntensityCell& cell,
                         SearchQuery query)
    : source_(&source), estimator_(&estimator), cell_(&cell), query_(std::move(query)) {}

uint64_t SamplerLoop::count(SampleOutcome outcome) const {
    const size_t i = static_cast<size_t>(outcome);
    if (i >= static_cast<size_t>(SampleOutcome::COUNT)) return 0;
    return counts_[i].load(std::memory_order_relaxed);
}

SampleOutcome SamplerLoop::tick() {
    auto finish = [this](SampleOutcome o) {
        counts_[static_cast<size_t>(o)].fetch_add(1, std::memory_order_relaxed);
        return o;
    };

    EventBatch batch;
    try {
        batch = source_->search(query_);
    } catch (const SourceError& e) {
        std::fprintf(stderr, "SamplerLoop: search keyword=%s failed (http=%ld): %s\n",
                     query_.keyword.c_str(), e.httpStatus(), e.what());
        return finish(SampleOutcome::SOURCE_ERROR);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "SamplerLoop: search keyword=%s failed: %s\n",
                     query_.keyword.c_str(), e.what());
        return finish(SampleOutcome::SOURCE_ERROR);
    }

    IntensityEstimate est;
    try {
        est = estimator_->estimate(batch);
    } catch (const InsufficientDataError& e) {
        std::fprintf(stderr, "SamplerLoop: keyword=%s events=%zu: %s\n",
                     query_.keyword.c_str(), batch.size(), e.what());
        return finish(SampleOutcome::INSUFFICIENT_DATA);
    } catch (const TimestampParseError& e) {
        std::fprintf(stderr, "SamplerLoop: keyword=%s events=%zu: %s\n",
                     query_.keyword.c_str(), batch.size(), e.what());
        return finish(SampleOutcome::PARSE_ERROR);
    }

    if (est.reordered) {
        std::fprintf(stderr, "SamplerLoop: keyword=%s batch arrived oldest-first, walked in reverse\n",
                     query_.keyword.c_str());
    }

    cell_->store(est.intensity);
    std::printf("SamplerLoop: keyword=%s events=%zu avg_gap=%.3fs ratio=%.3f intensity=%d\n",
                query_.keyword.c_str(), est.event_count, est.avg_gap_sec, est.ratio,
                est.intensity);
    return finish(SampleOutcome::UPDATED);
}

}  // namespace heatcast
