#pragma once

#include "state/intensity_cell.h"
#include "transport/i_osc_transport.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace heatcast {

enum class PublishOutcome : uint8_t {
    IDLE = 0,       // cell still absent, nothing sent
    SENT,
    SEND_FAILED,
    COUNT
};

const char* toString(PublishOutcome outcome);

/// One publishing iteration: read the cell, send its value if present.
/// Send failures are logged and dropped; the next tick sends whatever the
/// cell holds then.
class PublisherLoop {
public:
    PublisherLoop(const IntensityCell& cell, IOscTransport& transport, std::string address);

    PublishOutcome tick();

    uint64_t count(PublishOutcome outcome) const;
    const std::string& address() const { return address_; }

private:
    const IntensityCell* cell_;
    IOscTransport* transport_;
    std::string address_;
    std::atomic<uint64_t> counts_[static_cast<size_t>(PublishOutcome::COUNT)] = {};
};

}  // namespace heatcast
