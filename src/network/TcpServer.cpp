#include "streamux/network/TcpServer.h"
#include "streamux/network/EventLoop.h"
#include "streamux/network/Acceptor.h"
#include "streamux/network/Channel.h"
#include "streamux/common/Logger.h"

#include <sys/socket.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <functional>
#include <vector>

namespace streamux {
namespace network {

namespace {

InetAddress LocalAddressOf(int sockfd) {
    struct sockaddr_in local;
    std::memset(&local, 0, sizeof local);
    socklen_t len = static_cast<socklen_t>(sizeof local);
    if (::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&local), &len) < 0) {
        LOG_ERROR << "getsockname failed fd=" << sockfd << " errno=" << errno;
    }
    return InetAddress(local);
}

} // namespace

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& nameArg)
    : loop_(loop),
      hostport_(listenAddr.toIpPort()),
      name_(nameArg),
      acceptor_(new Acceptor(loop, listenAddr)),
      threadPool_(new EventLoopThreadPool(loop, nameArg)),
      started_(0),
      nextConnId_(1) {
    acceptor_->SetNewConnectionCallback(
        std::bind(&TcpServer::NewConnection, this, std::placeholders::_1, std::placeholders::_2));
}

TcpServer::~TcpServer() {
    LOG_DEBUG << "TcpServer::~TcpServer [" << name_ << "] destructing";
    StopCleanupTimer();
    for (auto& item : connections_) {
        TcpConnectionPtr conn(item.second);
        item.second.reset();
        conn->getLoop()->RunInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
    }
}

InetAddress TcpServer::listenAddress() const {
    return acceptor_->LocalAddress();
}

void TcpServer::SetThreadNum(int numThreads) {
    threadPool_->SetThreadNum(numThreads);
}

void TcpServer::SetMaxConnections(int maxConnections) {
    maxConnections_ = maxConnections;
}

void TcpServer::SetIdleTimeout(double idleTimeoutSec, double cleanupIntervalSec) {
    idleTimeoutSec_ = idleTimeoutSec;
    cleanupIntervalSec_ = (cleanupIntervalSec > 0.0) ? cleanupIntervalSec : 1.0;
}

void TcpServer::Start() {
    if (started_++ == 0) {
        threadPool_->Start();
        if (idleTimeoutSec_ > 0.0) {
            loop_->RunInLoop([this]() { StartCleanupTimer(); });
        }
        loop_->RunInLoop(std::bind(&Acceptor::Listen, acceptor_.get()));
    }
}

void TcpServer::StartCleanupTimer() {
    if (cleanupTimerFd_ >= 0) return;

    cleanupTimerFd_ = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (cleanupTimerFd_ < 0) {
        LOG_ERROR << "TcpServer timerfd_create failed errno=" << errno;
        return;
    }

    cleanupTimerChannel_.reset(new Channel(loop_, cleanupTimerFd_));
    cleanupTimerChannel_->SetReadCallback([this](std::chrono::system_clock::time_point) {
        uint64_t expirations = 0;
        if (::read(cleanupTimerFd_, &expirations, sizeof expirations) != sizeof expirations) {
            return;
        }
        CleanupIdleConnections();
    });
    cleanupTimerChannel_->EnableReading();

    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    const long sec = static_cast<long>(cleanupIntervalSec_);
    const long nsec = static_cast<long>((cleanupIntervalSec_ - sec) * 1e9);
    howlong.it_interval.tv_sec = (sec > 0) ? sec : 0;
    howlong.it_interval.tv_nsec = (nsec > 0) ? nsec : (sec > 0 ? 0 : 1000000); // at least 1ms
    howlong.it_value = howlong.it_interval;
    if (::timerfd_settime(cleanupTimerFd_, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "TcpServer timerfd_settime failed errno=" << errno;
    }
}

void TcpServer::StopCleanupTimer() {
    if (cleanupTimerChannel_) {
        cleanupTimerChannel_->DisableAll();
        cleanupTimerChannel_->Remove();
        cleanupTimerChannel_.reset();
    }
    if (cleanupTimerFd_ >= 0) {
        ::close(cleanupTimerFd_);
        cleanupTimerFd_ = -1;
    }
}

void TcpServer::CleanupIdleConnections() {
    if (idleTimeoutSec_ <= 0.0) return;

    const auto now = std::chrono::steady_clock::now();
    const auto timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(idleTimeoutSec_));

    std::vector<TcpConnectionPtr> toClose;
    for (auto const& [connName, conn] : connections_) {
        if (!conn) continue;
        if (now - conn->LastActiveTime() > timeout) {
            LOG_WARN << "TcpServer::CleanupIdleConnections [" << name_ << "] closing idle conn "
                     << connName << " peer=" << conn->peerAddress().toIpPort();
            toClose.push_back(conn);
        }
    }

    for (auto& conn : toClose) {
        conn->ForceClose();
    }
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    const int currentTotal = static_cast<int>(connections_.size());
    if (maxConnections_ > 0 && currentTotal >= maxConnections_) {
        LOG_WARN << "TcpServer::NewConnection [" << name_ << "] reject (max total reached): "
                 << peerAddr.toIpPort() << " total=" << currentTotal << " limit=" << maxConnections_;
        ::close(sockfd);
        return;
    }

    char buf[64];
    std::snprintf(buf, sizeof buf, "-%s#%d", hostport_.c_str(), nextConnId_);
    ++nextConnId_;
    std::string connName = name_ + buf;

    LOG_INFO << "TcpServer::NewConnection [" << name_ << "] - new connection [" << connName
             << "] from " << peerAddr.toIpPort();

    EventLoop* ioLoop = threadPool_->GetNextLoop();
    TcpConnectionPtr conn(new TcpConnection(ioLoop,
                                            connName,
                                            sockfd,
                                            LocalAddressOf(sockfd),
                                            peerAddr));
    connections_[connName] = conn;
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetReadEofCallback(readEofCallback_);
    conn->SetCloseCallback(
        std::bind(&TcpServer::RemoveConnection, this, std::placeholders::_1));

    ioLoop->RunInLoop(std::bind(&TcpConnection::ConnectEstablished, conn));
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // Always defer removal to avoid re-entrancy inside TcpConnection event callbacks.
    loop_->QueueInLoop(std::bind(&TcpServer::RemoveConnectionInLoop, this, conn));
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    LOG_INFO << "TcpServer::RemoveConnectionInLoop [" << name_ << "] - connection " << conn->name();
    connections_.erase(conn->name());

    EventLoop* ioLoop = conn->getLoop();
    ioLoop->QueueInLoop(std::bind(&TcpConnection::ConnectDestroyed, conn));
}

} // namespace network
} // namespace streamux
