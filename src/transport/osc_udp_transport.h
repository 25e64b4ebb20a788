#pragma once

#include "transport/i_osc_transport.h"
#include "transport/udp_sender.h"

#include <cstdint>
#include <string>

namespace heatcast {

/// Encodes each send() as an OSC int32 message and ships it in one UDP
/// datagram to the host:port given at construction.
class OscUdpTransport : public IOscTransport {
public:
    /// Throws std::runtime_error if host cannot be resolved.
    OscUdpTransport(const std::string& host, uint16_t port);

    void send(const std::string& address, int32_t value) override;

    uint64_t messagesSent() const { return messages_sent_; }

private:
    UdpSender sender_;
    uint64_t messages_sent_ = 0;
};

}  // namespace heatcast
