#pragma once

#include <cstdint>
#include <string>

namespace heatcast {

/// Downstream message sink: one address path, one numeric argument.
/// Implementations: OscUdpTransport. Fire-and-forget; no acknowledgement.
class IOscTransport {
public:
    virtual ~IOscTransport() = default;

    /// Throws TransportError if the message could not be handed to the carrier.
    virtual void send(const std::string& address, int32_t value) = 0;
};

}  // namespace heatcast
