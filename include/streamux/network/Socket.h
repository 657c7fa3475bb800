#pragma once

#include "streamux/common/noncopyable.h"
#include "streamux/network/InetAddress.h"

namespace streamux {
namespace network {

// Owns a socket fd and closes it on destruction.
class Socket : streamux::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    void BindAddress(const InetAddress& localaddr);
    void Listen();
    int Accept(InetAddress* peeraddr);

    // Address the kernel actually bound (resolves port 0).
    InetAddress LocalAddress() const;

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetKeepAlive(bool on);

private:
    const int sockfd_;
};

} // namespace network
} // namespace streamux
