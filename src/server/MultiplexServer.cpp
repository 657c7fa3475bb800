#include "streamux/server/MultiplexServer.h"
#include "streamux/server/StreamSession.h"
#include "streamux/network/EventLoop.h"
#include "streamux/common/Config.h"
#include "streamux/common/Logger.h"

#include <algorithm>

namespace streamux {
namespace server {

using network::TcpConnectionPtr;

namespace {

// Lives in the TcpConnection context. The parser is only touched by the I/O
// loop; the session is shared with the workers.
struct ConnectionContext {
    std::shared_ptr<protocol::HttpContext> parser;
    std::shared_ptr<StreamSession> session;
};

ConnectionContext* GetConnectionContext(const TcpConnectionPtr& conn) {
    return std::any_cast<ConnectionContext>(conn->GetMutableContext());
}

} // namespace

MultiplexServer::Options MultiplexServer::Options::FromConfig(const common::Config& config,
                                                               const std::string& section,
                                                               int defaultWorkers) {
    Options opts;
    opts.ioThreads = std::max(0, config.GetInt("global", "io_threads", 0));
    opts.workers = config.GetInt(section, "workers", defaultWorkers);
    if (opts.workers <= 0) {
        LOG_WARN << "[" << section << "] workers must be positive, using " << defaultWorkers;
        opts.workers = defaultWorkers;
    }
    opts.idleTimeoutSec = config.GetDouble(section, "idle_timeout_sec", 0.0);
    opts.maxConnections = config.GetInt(section, "max_connections", 0);
    const int maxHeader = config.GetInt(section, "max_header_bytes",
                                        static_cast<int>(protocol::HttpContext::kDefaultMaxHeaderBytes));
    if (maxHeader > 0) opts.maxHeaderBytes = static_cast<size_t>(maxHeader);

    const std::string format = config.GetString("framing", "format", "length");
    if (auto parsed = protocol::FrameCodec::ParseFormat(format)) {
        opts.frameFormat = *parsed;
    } else {
        LOG_WARN << "[framing] unknown format '" << format << "', using length";
    }
    const int maxPayload = config.GetInt("framing", "max_payload", static_cast<int>(protocol::kMaxFramePayload));
    if (maxPayload <= 0 || static_cast<size_t>(maxPayload) > protocol::kMaxFramePayload) {
        LOG_WARN << "[framing] max_payload must be in 1.." << protocol::kMaxFramePayload
                 << ", using " << protocol::kMaxFramePayload;
    } else {
        opts.maxFramePayload = static_cast<size_t>(maxPayload);
    }
    return opts;
}

MultiplexServer::MultiplexServer(network::EventLoop* loop,
                                 const network::InetAddress& listenAddr,
                                 const std::string& name,
                                 std::shared_ptr<RequestHandler> handler,
                                 const Options& options)
    : options_(options),
      handler_(std::move(handler)),
      server_(loop, listenAddr, name),
      workers_(name + "-worker", options.workers) {
    server_.SetThreadNum(options_.ioThreads);
    server_.SetMaxConnections(options_.maxConnections);
    if (options_.idleTimeoutSec > 0.0) {
        server_.SetIdleTimeout(options_.idleTimeoutSec);
    }
    server_.SetConnectionCallback(
        std::bind(&MultiplexServer::OnConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(
        std::bind(&MultiplexServer::OnMessage, this, std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));
    server_.SetReadEofCallback(
        std::bind(&MultiplexServer::OnReadEof, this, std::placeholders::_1));
}

MultiplexServer::~MultiplexServer() {
    workers_.Stop();
}

void MultiplexServer::Start() {
    LOG_INFO << "MultiplexServer[" << server_.name() << "] starts listening on "
             << server_.listenAddress().toIpPort() << " (io_threads=" << options_.ioThreads
             << " workers=" << options_.workers
             << " framing=" << protocol::FrameCodec::FormatName(options_.frameFormat) << ")";
    workers_.Start();
    server_.Start();
}

void MultiplexServer::OnConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        std::weak_ptr<network::TcpConnection> weakConn(conn);
        auto sink = [weakConn](const std::string& unit) {
            TcpConnectionPtr c = weakConn.lock();
            if (!c || !c->connected()) return false;
            c->Send(unit);
            return true;
        };
        ConnectionContext ctx;
        ctx.parser = std::make_shared<protocol::HttpContext>(options_.maxHeaderBytes);
        ctx.session = std::make_shared<StreamSession>(conn->name(), std::move(sink));
        conn->SetContext(ctx);
        LOG_INFO << "MultiplexServer - " << conn->name() << " OPEN from " << conn->peerAddress().toIpPort();
    } else {
        ConnectionContext* ctx = GetConnectionContext(conn);
        if (ctx) {
            ctx->session->MarkClosed();
            LOG_INFO << "MultiplexServer - " << conn->name() << " CLOSED ("
                     << ctx->session->inflight() << " requests abandoned)";
        }
    }
}

void MultiplexServer::OnMessage(const TcpConnectionPtr& conn,
                                network::Buffer* buf,
                                std::chrono::system_clock::time_point receiveTime) {
    ConnectionContext* ctx = GetConnectionContext(conn);
    if (!ctx) return;
    protocol::HttpContext* parser = ctx->parser.get();

    while (buf->ReadableBytes() > 0) {
        if (!parser->parseRequest(buf, receiveTime)) {
            LOG_WARN << "MultiplexServer - " << conn->name() << " dropped malformed request: " << parser->error();
            parser->reset();
            continue;
        }
        if (!parser->gotAll()) {
            return;
        }
        protocol::HttpRequest req;
        req.swap(parser->request());
        parser->reset();
        Dispatch(conn, std::move(req));
    }
}

void MultiplexServer::Dispatch(const TcpConnectionPtr& conn, protocol::HttpRequest req) {
    std::shared_ptr<StreamSession> session = GetConnectionContext(conn)->session;
    session->BeginRequest();

    LOG_DEBUG << "MultiplexServer - " << conn->name() << " " << req.method() << " " << req.path()
              << (req.multiplexed() ? " stream=" + std::to_string(*req.streamId()) : std::string());

    auto request = std::make_shared<protocol::HttpRequest>(std::move(req));
    const bool queued = workers_.Submit([this, conn, session, request]() {
        if (request->multiplexed()) {
            FramedResponseWriter writer(session, *request->streamId(),
                                        options_.frameFormat, options_.maxFramePayload);
            handler_->Handle(*request, &writer);
        } else {
            PlainResponseWriter writer(session);
            handler_->Handle(*request, &writer);
        }
        if (session->EndRequest()) {
            conn->CloseWhenDrained();
        }
    });
    if (!queued) {
        LOG_WARN << "MultiplexServer - " << conn->name() << " worker pool stopped, request dropped";
        if (session->EndRequest()) {
            conn->CloseWhenDrained();
        }
    }
}

void MultiplexServer::OnReadEof(const TcpConnectionPtr& conn) {
    ConnectionContext* ctx = GetConnectionContext(conn);
    if (!ctx) {
        conn->ForceClose();
        return;
    }
    if (ctx->session->MarkClosing()) {
        conn->CloseWhenDrained();
    }
}

} // namespace server
} // namespace streamux
