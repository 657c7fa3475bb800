#pragma once

#include "streamux/common/noncopyable.h"
#include "streamux/network/InetAddress.h"
#include "streamux/network/Callbacks.h"
#include "streamux/network/TcpConnection.h"
#include "streamux/network/EventLoopThreadPool.h"

#include <atomic>
#include <map>
#include <memory>
#include <string>

namespace streamux {
namespace network {

class EventLoop;
class Acceptor;
class Channel;

class TcpServer : streamux::common::noncopyable {
public:
    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg);
    ~TcpServer();

    const std::string& hostport() const { return hostport_; }
    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }

    // Bound address; differs from the requested one when port 0 was asked for.
    InetAddress listenAddress() const;

    void SetThreadNum(int numThreads);

    // 0 means unlimited
    void SetMaxConnections(int maxConnections);
    // Idle connection cleanup (0 disables). cleanupIntervalSec defaults to 1s if <=0.
    void SetIdleTimeout(double idleTimeoutSec, double cleanupIntervalSec = 1.0);

    void Start();

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetReadEofCallback(const ReadEofCallback& cb) { readEofCallback_ = cb; }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);

    void StartCleanupTimer();
    void StopCleanupTimer();
    void CleanupIdleConnections();

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;
    std::unique_ptr<EventLoopThreadPool> threadPool_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    ReadEofCallback readEofCallback_;

    std::atomic_int started_;
    int nextConnId_;
    ConnectionMap connections_;

    int maxConnections_{0};

    double idleTimeoutSec_{0.0};
    double cleanupIntervalSec_{1.0};
    int cleanupTimerFd_{-1};
    std::unique_ptr<Channel> cleanupTimerChannel_;
};

} // namespace network
} // namespace streamux
