#include "transport/udp_sender.h"

#include <cstring>
#include <stdexcept>

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
    #endif
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")

    namespace {
    struct WinsockInit {
        WinsockInit() {
            WSADATA wsa;
            WSAStartup(MAKEWORD(2, 2), &wsa);
        }
        ~WinsockInit() { WSACleanup(); }
    };
    static WinsockInit g_winsock_init;
    }  // namespace

    using socket_t = SOCKET;
    constexpr socket_t kInvalidSocket = INVALID_SOCKET;
    inline int closeSocket(socket_t s) { return closesocket(s); }
    inline std::string socketErrorString() {
        return "winsock error " + std::to_string(WSAGetLastError());
    }
#else
    #include <arpa/inet.h>
    #include <cerrno>
    #include <netdb.h>
    #include <netinet/in.h>
    #include <sys/socket.h>
    #include <unistd.h>

    using socket_t = int;
    constexpr socket_t kInvalidSocket = -1;
    inline int closeSocket(socket_t s) { return close(s); }
    inline std::string socketErrorString() { return std::strerror(errno); }
#endif

namespace heatcast {

struct UdpSender::SockAddr {
    struct sockaddr_in addr;
};

UdpSender::UdpSender(const std::string& host, uint16_t port)
    : sock_(static_cast<decltype(sock_)>(kInvalidSocket))
    , dest_(new SockAddr{})
    , host_(host)
    , port_(port)
{
    std::memset(&dest_->addr, 0, sizeof(dest_->addr));
    dest_->addr.sin_family = AF_INET;
    dest_->addr.sin_port = htons(port);

    if (inet_pton(AF_INET, host.c_str(), &dest_->addr.sin_addr) != 1) {
        struct addrinfo hints{}, *result = nullptr;
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;
        if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || !result)
            throw std::runtime_error("UdpSender: cannot resolve " + host);
        dest_->addr.sin_addr =
            reinterpret_cast<struct sockaddr_in*>(result->ai_addr)->sin_addr;
        freeaddrinfo(result);
    }

    sock_ = static_cast<decltype(sock_)>(socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP));
    if (static_cast<socket_t>(sock_) == kInvalidSocket)
        throw std::runtime_error("UdpSender: socket() failed: " + socketErrorString());
}

UdpSender::~UdpSender() {
    if (static_cast<socket_t>(sock_) != kInvalidSocket)
        closeSocket(static_cast<socket_t>(sock_));
}

bool UdpSender::send(const uint8_t* data, size_t len) {
    auto sent = sendto(
        static_cast<socket_t>(sock_),
        reinterpret_cast<const char*>(data),
        static_cast<int>(len),
        0,
        reinterpret_cast<const struct sockaddr*>(&dest_->addr),
        sizeof(dest_->addr));

    if (sent < 0) {
        last_error_ = socketErrorString();
        return false;
    }
    if (static_cast<size_t>(sent) != len) {
        last_error_ = "short send (" + std::to_string(sent) + " of " +
                      std::to_string(len) + " bytes)";
        return false;
    }
    return true;
}

}  // namespace heatcast
