#pragma once

#include "streamux/common/noncopyable.h"
#include "streamux/common/WorkerPool.h"
#include "streamux/network/TcpServer.h"
#include "streamux/protocol/HttpContext.h"
#include "streamux/protocol/StreamFramer.h"
#include "streamux/server/RequestHandler.h"

#include <memory>
#include <string>

namespace streamux {
namespace common {
class Config;
}

namespace server {

// Accepts connections and hands every complete request to a worker, which
// answers through the connection's StreamSession. Requests carrying a stream
// id are answered in frames; the rest get one plain response each.
//
// A peer that half-closes still receives the responses to everything it sent;
// the connection is closed after the last of them has been written.
class MultiplexServer : streamux::common::noncopyable {
public:
    struct Options {
        int ioThreads = 0;
        int workers = 8;
        double idleTimeoutSec = 0.0;
        int maxConnections = 0;
        size_t maxHeaderBytes = protocol::HttpContext::kDefaultMaxHeaderBytes;
        protocol::FrameCodec::Format frameFormat = protocol::FrameCodec::Format::kLengthPrefixed;
        size_t maxFramePayload = protocol::kMaxFramePayload;

        // [global] io_threads, [<section>] workers/idle_timeout_sec/
        // max_connections/max_header_bytes, [framing] format/max_payload.
        static Options FromConfig(const common::Config& config,
                                  const std::string& section,
                                  int defaultWorkers);
    };

    MultiplexServer(network::EventLoop* loop,
                    const network::InetAddress& listenAddr,
                    const std::string& name,
                    std::shared_ptr<RequestHandler> handler,
                    const Options& options);
    ~MultiplexServer();

    void Start();

    network::EventLoop* getLoop() const { return server_.getLoop(); }
    network::InetAddress listenAddress() const { return server_.listenAddress(); }
    const Options& options() const { return options_; }

private:
    void OnConnection(const network::TcpConnectionPtr& conn);
    void OnMessage(const network::TcpConnectionPtr& conn,
                   network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void OnReadEof(const network::TcpConnectionPtr& conn);
    void Dispatch(const network::TcpConnectionPtr& conn, protocol::HttpRequest req);

    const Options options_;
    std::shared_ptr<RequestHandler> handler_;
    network::TcpServer server_;
    // Declared last: destroyed first, so queued tasks finish while the
    // connections they write to still exist.
    common::WorkerPool workers_;
};

} // namespace server
} // namespace streamux
