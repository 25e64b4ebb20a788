#pragma once

#include "core/event_batch.h"
#include "model/intensity_estimator.h"
#include "source/i_event_source.h"
#include "state/intensity_cell.h"

#include <atomic>
#include <cstdint>

namespace heatcast {

enum class SampleOutcome : uint8_t {
    UPDATED = 0,
    SOURCE_ERROR,
    PARSE_ERROR,
    INSUFFICIENT_DATA,
    COUNT
};

const char* toString(SampleOutcome outcome);

/// One sampling iteration: fetch -> estimate -> store.
/// Every failure is logged and abandons the iteration without touching the
/// cell, so the cell only ever holds the result of a complete estimate.
class SamplerLoop {
public:
    SamplerLoop(IEventSource& source,
                const IntensityEstimator& estimator,
                IntensityCell& cell,
                SearchQuery query);

    SampleOutcome tick();

    uint64_t count(SampleOutcome outcome) const;
    const SearchQuery& query() const { return query_; }

private:
    IEventSource* source_;
    const IntensityEstimator* estimator_;
    IntensityCell* cell_;
    SearchQuery query_;
    std::atomic<uint64_t> counts_[static_cast<size_t>(SampleOutcome::COUNT)] = {};
};

}  // namespace heatcast
