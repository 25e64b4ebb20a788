#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace heatcast {

/// Fire-and-forget unicast UDP sender.
/// Cross-platform: uses Winsock on Windows, POSIX sockets elsewhere.
class UdpSender {
public:
    /// Resolves host (dotted quad first, then DNS) once, at construction.
    /// Throws std::runtime_error if the socket cannot be created or the host
    /// cannot be resolved.
    UdpSender(const std::string& host, uint16_t port);
    ~UdpSender();

    UdpSender(const UdpSender&) = delete;
    UdpSender& operator=(const UdpSender&) = delete;

    /// Send one datagram. Returns true on success; on failure lastError()
    /// describes the cause.
    bool send(const uint8_t* data, size_t len);

    const std::string& lastError() const { return last_error_; }
    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

private:
#ifdef _WIN32
    uintptr_t sock_;  // SOCKET is uintptr_t on Windows
#else
    int sock_;
#endif
    struct SockAddr;
    std::unique_ptr<SockAddr> dest_;
    std::string host_;
    uint16_t port_;
    std::string last_error_;
};

}  // namespace heatcast
