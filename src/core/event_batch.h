#pragma once

#include <string>
#include <vector>

namespace heatcast {

/// One upstream event. created_at is kept as delivered; parsing happens
/// in the estimator so a bad timestamp aborts the whole iteration.
struct EventItem {
    std::string id;
    std::string created_at;
};

/// Events in source order (newest-first).
using EventBatch = std::vector<EventItem>;

/// Parameters of one upstream search.
struct SearchQuery {
    std::string keyword;
    std::string result_type = "recent";
    int count = 100;
};

}  // namespace heatcast
