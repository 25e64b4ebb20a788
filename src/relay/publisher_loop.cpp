#include "relay/publisher_loop.h"
#include "core/errors.h"

#include <cstdio>
#include <utility>

namespace heatcast {

const char* toString(PublishOutcome outcome) {
    switch (outcome) {
        case PublishOutcome::IDLE:        return "idle";
        case PublishOutcome::SENT:        return "sent";
        case PublishOutcome::SEND_FAILED: return "send_failed";
        default:                          return "unknown";
    }
}

PublisherLoop::PublisherLoop(const IntensityCell& cell, IOscTransport& transport, std::string address)
    : cell_(&cell), transport_(&transport), address_(std::move(address)) {}

uint64_t PublisherLoop::count(PublishOutcome outcome) const {
    const size_t i = static_cast<size_t>(outcome);
    if (i >= static_cast<size_t>(PublishOutcome::COUNT)) return 0;
    return counts_[i].load(std::memory_order_relaxed);
}

PublishOutcome PublisherLoop::tick() {
    PublishOutcome outcome = PublishOutcome::SENT;

    int32_t value = 0;
    if (!cell_->load(value)) {
        outcome = PublishOutcome::IDLE;
    } else {
        try {
            transport_->send(address_, value);
        } catch (const TransportError& e) {
            std::fprintf(stderr, "PublisherLoop: send %s %d failed: %s\n",
                         address_.c_str(), value, e.what());
            outcome = PublishOutcome::SEND_FAILED;
        }
    }

    counts_[static_cast<size_t>(outcome)].fetch_add(1, std::memory_order_relaxed);
    return outcome;
}

}  // namespace heatcast
