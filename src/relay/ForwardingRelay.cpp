#include "streamux/relay/ForwardingRelay.h"
#include "streamux/network/BlockingConnection.h"
#include "streamux/server/StatusEngine.h"
#include "streamux/common/Logger.h"

#include <cctype>
#include <cstdlib>
#include <memory>
#include <optional>

namespace streamux {
namespace relay {

using network::BlockingConnection;
using protocol::HttpResponse;

namespace {

// Watches the upstream bytes to tell when a Content-Length-delimited response
// is complete; without a length the response ends at EOF.
class ResponseBoundary {
public:
    void Feed(const std::string& chunk) {
        received_ += chunk.size();
        if (expected_ || headDone_) return;
        head_.append(chunk);
        const size_t headEnd = head_.find("\r\n\r\n");
        if (headEnd == std::string::npos) return;
        headDone_ = true;
        expected_ = ExpectedTotal(head_.substr(0, headEnd + 2), headEnd + 4);
        head_.clear();
    }

    bool complete() const { return expected_ && received_ >= *expected_; }
    size_t received() const { return received_; }

private:
    static std::optional<size_t> ExpectedTotal(const std::string& head, size_t headLen) {
        // "HTTP/1.1 304 ..." and other bodiless codes end with the head.
        const size_t sp = head.find(' ');
        if (sp != std::string::npos && head.size() >= sp + 4) {
            const std::string code = head.substr(sp + 1, 3);
            if (code == "304" || code == "204" || code[0] == '1') return headLen;
        }

        size_t pos = 0;
        while (pos < head.size()) {
            const size_t eol = head.find("\r\n", pos);
            if (eol == std::string::npos) break;
            const std::string line = head.substr(pos, eol - pos);
            pos = eol + 2;
            const size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string name = line.substr(0, colon);
            for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (name != "content-length") continue;
            const char* value = line.c_str() + colon + 1;
            char* endp = nullptr;
            const unsigned long long len = std::strtoull(value, &endp, 10);
            if (endp == value) return std::nullopt;
            return headLen + static_cast<size_t>(len);
        }
        return std::nullopt;
    }

    std::string head_;
    bool headDone_{false};
    std::optional<size_t> expected_;
    size_t received_{0};
};

} // namespace

ForwardingRelay::ForwardingRelay(OriginResolver resolver, int upstreamTimeoutMs)
    : resolver_(std::move(resolver)),
      upstreamTimeoutMs_(upstreamTimeoutMs > 0 ? upstreamTimeoutMs : 5000) {
}

std::string ForwardingRelay::BuildUpstreamRequest(const protocol::HttpRequest& req) {
    std::string out;
    out.reserve(req.rawHead().size() + 2 + req.body().size());
    out.append(req.rawHead());
    out.append("\r\n");
    out.append(req.body());
    return out;
}

void ForwardingRelay::Fail(const protocol::HttpRequest& req,
                           server::ResponseWriter* writer,
                           const std::string& error) const {
    LOG_WARN << "ForwardingRelay: " << req.method() << " " << req.path() << " failed: " << error;
    if (!writer->WriteResponse(server::StatusEngine::MakeResponse(HttpResponse::k500InternalServerError, error))) {
        LOG_DEBUG << "ForwardingRelay: client gone before error reply for " << req.path();
    }
}

void ForwardingRelay::Handle(const protocol::HttpRequest& req, server::ResponseWriter* writer) {
    if (req.version() != server::StatusEngine::kSupportedVersion) {
        LOG_DEBUG << "ForwardingRelay: " << req.path() << " -> 505 (version " << req.version() << ")";
        if (!writer->WriteResponse(server::StatusEngine::MakeResponse(HttpResponse::k505HttpVersionNotSupported))) {
            LOG_DEBUG << "ForwardingRelay: client gone before 505 for " << req.path();
        }
        return;
    }

    std::string error;
    std::optional<OriginResolver::Origin> origin = resolver_.Select(req, &error);
    if (!origin) {
        Fail(req, writer, error);
        return;
    }
    std::optional<network::InetAddress> addr = resolver_.Resolve(*origin, &error);
    if (!addr) {
        Fail(req, writer, error);
        return;
    }

    std::unique_ptr<BlockingConnection> upstream = BlockingConnection::Connect(*addr, upstreamTimeoutMs_, &error);
    if (!upstream) {
        Fail(req, writer, error);
        return;
    }

    if (upstream->SendAll(BuildUpstreamRequest(req)) != BlockingConnection::Status::kOk) {
        Fail(req, writer, upstream->lastError());
        return;
    }

    ResponseBoundary boundary;
    while (!boundary.complete()) {
        std::string chunk;
        const BlockingConnection::Status st = upstream->Receive(&chunk, kReadChunk);
        if (st == BlockingConnection::Status::kEof) break;
        if (st != BlockingConnection::Status::kOk) {
            if (boundary.received() == 0) {
                Fail(req, writer, upstream->lastError());
                return;
            }
            LOG_WARN << "ForwardingRelay: " << req.path() << " upstream "
                     << BlockingConnection::StatusToString(st) << " after " << boundary.received()
                     << " bytes: " << upstream->lastError();
            break;
        }
        boundary.Feed(chunk);
        if (!writer->Write(chunk)) {
            LOG_DEBUG << "ForwardingRelay: client gone, dropping " << req.path();
            return;
        }
    }

    if (boundary.received() == 0) {
        Fail(req, writer, "origin " + addr->toIpPort() + " closed without a response");
        return;
    }

    LOG_INFO << "ForwardingRelay: " << req.method() << " " << req.path() << " via "
             << addr->toIpPort() << " (" << boundary.received() << " bytes)";
    if (!writer->Finish()) {
        LOG_DEBUG << "ForwardingRelay: client gone before end of " << req.path();
    }
}

} // namespace relay
} // namespace streamux
