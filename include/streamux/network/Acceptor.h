#pragma once

#include "streamux/common/noncopyable.h"
#include "streamux/network/Channel.h"
#include "streamux/network/Socket.h"

#include <functional>

namespace streamux {
namespace network {

class EventLoop;
class InetAddress;

class Acceptor : streamux::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        newConnectionCallback_ = cb;
    }

    bool Listening() const { return listening_; }
    void Listen();

    InetAddress LocalAddress() const { return acceptSocket_.LocalAddress(); }

private:
    void HandleRead();

    EventLoop* loop_;
    Socket acceptSocket_;
    Channel acceptChannel_;
    NewConnectionCallback newConnectionCallback_;
    bool listening_;
};

} // namespace network
} // namespace streamux
