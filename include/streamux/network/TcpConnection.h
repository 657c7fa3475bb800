#pragma once

#include "streamux/common/noncopyable.h"
#include "streamux/network/Buffer.h"
#include "streamux/network/Callbacks.h"
#include "streamux/network/InetAddress.h"

#include <any>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace streamux {
namespace network {

class Channel;
class EventLoop;
class Socket;

// One accepted TCP connection, driven by the EventLoop it was assigned to.
// Send(), ForceClose() and CloseWhenDrained() may be called from
// any thread; everything else runs in the loop thread.
class TcpConnection : streamux::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    bool disconnected() const { return state_ == kDisconnected; }

    void SetContext(const std::any& context) { context_ = context; }
    const std::any& GetContext() const { return context_; }
    std::any* GetMutableContext() { return &context_; }

    // Each call is queued to the loop as one unit, so bytes of two Send()
    // calls never interleave in the output buffer.
    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    void ForceClose();
    // Close once everything already queued by Send() has been written.
    void CloseWhenDrained();

    std::chrono::steady_clock::time_point LastActiveTime() const;

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }
    // Without this callback a read EOF closes the connection at once.
    void SetReadEofCallback(const ReadEofCallback& cb) { readEofCallback_ = cb; }

    // Called when TcpServer accepts a new connection
    void ConnectEstablished();
    // Called when TcpServer has removed me from its map
    void ConnectDestroyed();

private:
    enum StateE { kDisconnected, kConnecting, kConnected };

    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const void* data, size_t len);
    void ForceCloseInLoop();
    void CloseWhenDrainedInLoop();
    void StopReadInLoop();
    void Touch();

    void SetState(StateE s) { state_ = s; }
    static const char* StateToString(StateE s);

    EventLoop* loop_;
    const std::string name_;
    std::atomic<StateE> state_;
    bool reading_;
    bool closeWhenDrained_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    CloseCallback closeCallback_;
    ReadEofCallback readEofCallback_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;

    std::atomic<std::int64_t> lastActiveNs_;
};

} // namespace network
} // namespace streamux
