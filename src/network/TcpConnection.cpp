#include "streamux/network/TcpConnection.h"
#include "streamux/network/Channel.h"
#include "streamux/network/EventLoop.h"
#include "streamux/network/Socket.h"
#include "streamux/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>

namespace streamux {
namespace network {

static std::int64_t ToSteadyNs(std::chrono::steady_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

static std::chrono::steady_clock::time_point FromSteadyNs(std::int64_t ns) {
    return std::chrono::steady_clock::time_point(std::chrono::nanoseconds(ns));
}

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& nameArg,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr)
    : loop_(loop),
      name_(nameArg),
      state_(kConnecting),
      reading_(true),
      closeWhenDrained_(false),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr) {
    channel_->SetReadCallback(
        [this](std::chrono::system_clock::time_point t) { HandleRead(t); });
    channel_->SetWriteCallback([this]() { HandleWrite(); });
    channel_->SetCloseCallback([this]() { HandleClose(); });
    channel_->SetErrorCallback([this]() { HandleError(); });

    LOG_DEBUG << "TcpConnection::ctor[" << name_ << "] at " << this << " fd=" << sockfd;
    socket_->SetKeepAlive(true);
    socket_->SetTcpNoDelay(true);
    lastActiveNs_.store(ToSteadyNs(std::chrono::steady_clock::now()), std::memory_order_relaxed);
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection::dtor[" << name_ << "] at " << this
              << " fd=" << channel_->fd() << " state=" << StateToString(state_);
}

const char* TcpConnection::StateToString(StateE s) {
    switch (s) {
        case kDisconnected: return "kDisconnected";
        case kConnecting: return "kConnecting";
        case kConnected: return "kConnected";
        default: return "unknown";
    }
}

void TcpConnection::ConnectEstablished() {
    SetState(kConnected);
    Touch();
    channel_->Tie(shared_from_this());
    channel_->EnableReading();

    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == kConnected) {
        SetState(kDisconnected);
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    int savedErrno = 0;
    ssize_t n = inputBuffer_.ReadFd(channel_->fd(), &savedErrno);
    if (n > 0) {
        Touch();
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
    } else if (n == 0) {
        if (readEofCallback_ && state_ == kConnected) {
            // Half-close: stop reading, keep the write side for pending replies.
            LOG_DEBUG << "TcpConnection[" << name_ << "] peer half-closed";
            StopReadInLoop();
            readEofCallback_(shared_from_this());
        } else {
            HandleClose();
        }
    } else {
        if (savedErrno == EAGAIN || savedErrno == EWOULDBLOCK || savedErrno == EINTR) return;
        LOG_ERROR << "TcpConnection::HandleRead [" << name_ << "] errno=" << savedErrno;
        HandleError();
        HandleClose();
    }
}

void TcpConnection::HandleWrite() {
    if (!channel_->IsWriting()) {
        LOG_DEBUG << "Connection fd = " << channel_->fd() << " is down, no more writing";
        return;
    }

    ssize_t n = ::send(channel_->fd(), outputBuffer_.Peek(), outputBuffer_.ReadableBytes(), MSG_NOSIGNAL);
    if (n > 0) {
        Touch();
        outputBuffer_.Retrieve(static_cast<size_t>(n));
        if (outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
            if (closeWhenDrained_) {
                HandleClose();
            }
        }
    } else {
        const int savedErrno = errno;
        if (savedErrno == EAGAIN || savedErrno == EWOULDBLOCK || savedErrno == EINTR) return;
        LOG_ERROR << "TcpConnection::HandleWrite [" << name_ << "] errno=" << savedErrno;
        HandleClose();
    }
}

void TcpConnection::HandleClose() {
    if (state_ == kDisconnected) return;
    LOG_DEBUG << "TcpConnection::HandleClose [" << name_ << "] fd = " << channel_->fd()
              << " state = " << StateToString(state_);
    SetState(kDisconnected);
    channel_->DisableAll();

    TcpConnectionPtr guardThis(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guardThis);
    }

    if (closeCallback_) {
        closeCallback_(guardThis);
    }
}

void TcpConnection::HandleError() {
    int err = 0;
    int optval = 0;
    socklen_t optlen = static_cast<socklen_t>(sizeof optval);
    if (::getsockopt(channel_->fd(), SOL_SOCKET, SO_ERROR, &optval, &optlen) < 0) {
        err = errno;
    } else {
        err = optval;
    }
    LOG_ERROR << "TcpConnection::HandleError name:" << name_ << " - SO_ERROR:" << err;
}

void TcpConnection::Send(const std::string& message) {
    if (state_ != kConnected) return;
    if (loop_->IsInLoopThread()) {
        SendInLoop(message.data(), message.size());
    } else {
        loop_->RunInLoop([ptr = shared_from_this(), msg = message]() {
            ptr->SendInLoop(msg.data(), msg.size());
        });
    }
}

void TcpConnection::Send(const void* data, size_t len) {
    Send(std::string(static_cast<const char*>(data), len));
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    ssize_t nwrote = 0;
    size_t remaining = len;
    bool faultError = false;

    if (state_ == kDisconnected) {
        LOG_WARN << "TcpConnection[" << name_ << "] disconnected, give up writing " << len << " bytes";
        return;
    }

    // if nothing in output queue, try write directly
    if (!channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        nwrote = ::send(channel_->fd(), data, len, MSG_NOSIGNAL);
        if (nwrote >= 0) {
            Touch();
            remaining = len - static_cast<size_t>(nwrote);
        } else {
            nwrote = 0;
            if (errno != EWOULDBLOCK && errno != EAGAIN) {
                LOG_ERROR << "TcpConnection::SendInLoop [" << name_ << "] errno=" << errno;
                if (errno == EPIPE || errno == ECONNRESET) {
                    faultError = true;
                }
            }
        }
    }

    if (faultError) {
        // Peer is gone; tear down after the current callback chain unwinds.
        loop_->QueueInLoop([self = shared_from_this()]() { self->ForceCloseInLoop(); });
        return;
    }

    if (remaining > 0) {
        outputBuffer_.Append(static_cast<const char*>(data) + nwrote, remaining);
        if (!channel_->IsWriting()) {
            channel_->EnableWriting();
        }
    }
}

void TcpConnection::ForceClose() {
    if (state_ == kConnected) {
        loop_->RunInLoop([self = shared_from_this()]() { self->ForceCloseInLoop(); });
    }
}

void TcpConnection::ForceCloseInLoop() {
    if (state_ == kConnected) {
        HandleClose();
    }
}

void TcpConnection::CloseWhenDrained() {
    // Queued behind any Send() issued before this call from the same thread.
    loop_->QueueInLoop([self = shared_from_this()]() { self->CloseWhenDrainedInLoop(); });
}

void TcpConnection::CloseWhenDrainedInLoop() {
    if (state_ == kDisconnected) return;
    if (outputBuffer_.ReadableBytes() == 0) {
        HandleClose();
    } else {
        closeWhenDrained_ = true;
    }
}

void TcpConnection::StopReadInLoop() {
    if (reading_) {
        reading_ = false;
        channel_->DisableReading();
    }
}

void TcpConnection::Touch() {
    lastActiveNs_.store(ToSteadyNs(std::chrono::steady_clock::now()), std::memory_order_relaxed);
}

std::chrono::steady_clock::time_point TcpConnection::LastActiveTime() const {
    return FromSteadyNs(lastActiveNs_.load(std::memory_order_relaxed));
}

} // namespace network
} // namespace streamux
