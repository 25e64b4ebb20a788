#pragma once

#include "core/event_batch.h"

namespace heatcast {

/// Upstream event provider.
/// Implementations: TwitterSearchSource (tests substitute scripted fakes).
class IEventSource {
public:
    virtual ~IEventSource() = default;

    /// Returns at most query.count items, newest-first.
    /// Throws SourceError if the call itself fails.
    virtual EventBatch search(const SearchQuery& query) = 0;
};

}  // namespace heatcast
