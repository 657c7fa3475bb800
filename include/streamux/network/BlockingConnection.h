#pragma once

#include "streamux/common/noncopyable.h"
#include "streamux/network/InetAddress.h"

#include <memory>
#include <string>

namespace streamux {
namespace network {

class Socket;

// Outbound TCP connection driven synchronously from a worker thread. Every
// operation waits at most timeoutMs for the socket to become ready.
class BlockingConnection : streamux::common::noncopyable {
public:
    enum class Status {
        kOk,
        kEof,
        kTimeout,
        kError,
    };

    // nullptr on failure; *error receives a description.
    static std::unique_ptr<BlockingConnection> Connect(const InetAddress& addr,
                                                       int timeoutMs,
                                                       std::string* error);
    ~BlockingConnection();

    Status SendAll(const std::string& data);
    // Appends at most maxBytes to *out. kEof when the peer closed.
    Status Receive(std::string* out, size_t maxBytes);

    const InetAddress& peerAddress() const { return peerAddr_; }
    const std::string& lastError() const { return lastError_; }

    static const char* StatusToString(Status s);

private:
    BlockingConnection(int sockfd, const InetAddress& peerAddr, int timeoutMs);

    Status WaitFor(short events);

    std::unique_ptr<Socket> socket_;
    const InetAddress peerAddr_;
    const int timeoutMs_;
    std::string lastError_;
};

} // namespace network
} // namespace streamux
