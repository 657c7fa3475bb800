#pragma once

#include <netinet/in.h>

#include <cstdint>
#include <optional>
#include <string>

namespace streamux {
namespace network {

// IPv4 endpoint.
class InetAddress {
public:
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);
    InetAddress(const std::string& ip, uint16_t port);
    explicit InetAddress(const struct sockaddr_in& addr)
        : addr_(addr) {}

    // Numeric dotted-quad only; nullopt when ip is not one.
    static std::optional<InetAddress> FromIp(const std::string& ip, uint16_t port);
    // Name lookup through getaddrinfo(); first IPv4 result wins.
    static std::optional<InetAddress> Resolve(const std::string& host, uint16_t port);

    sa_family_t family() const { return addr_.sin_family; }
    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }
    void setSockAddr(const struct sockaddr_in& addr) { addr_ = addr; }

private:
    struct sockaddr_in addr_;
};

} // namespace network
} // namespace streamux
