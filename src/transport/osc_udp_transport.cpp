#include "transport/osc_udp_transport.h"
#include "transport/osc_message.h"
#include "core/errors.h"

#include <stdexcept>
#include <vector>

namespace heatcast {

OscUdpTransport::OscUdpTransport(const std::string& host, uint16_t port)
    : sender_(host, port) {}

void OscUdpTransport::send(const std::string& address, int32_t value) {
    std::vector<uint8_t> datagram;
    try {
        datagram = osc::encodeMessage(osc::Int32Message{address, value});
    } catch (const std::invalid_argument& e) {
        throw TransportError(e.what());
    }

    if (!sender_.send(datagram.data(), datagram.size())) {
        throw TransportError("sendto " + sender_.host() + ":" +
                             std::to_string(sender_.port()) + " " + address +
                             " failed: " + sender_.lastError());
    }
    ++messages_sent_;
}

}  // namespace heatcast
