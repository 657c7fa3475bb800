#pragma once

#include "streamux/relay/OriginResolver.h"
#include "streamux/server/RequestHandler.h"

#include <string>

namespace streamux {
namespace relay {

// Proxies each request over its own upstream connection and copies the
// origin's response back unchanged. Unsupported versions are answered with
// 505 locally; upstream failures before any response byte arrived become 500.
class ForwardingRelay : public server::RequestHandler {
public:
    static const size_t kReadChunk = 4096;

    ForwardingRelay(OriginResolver resolver, int upstreamTimeoutMs);

    void Handle(const protocol::HttpRequest& req, server::ResponseWriter* writer) override;

    // Bytes sent upstream: request line and headers as received (STREAM-ID
    // already removed by the parser), blank line, body.
    static std::string BuildUpstreamRequest(const protocol::HttpRequest& req);

private:
    void Fail(const protocol::HttpRequest& req, server::ResponseWriter* writer, const std::string& error) const;

    const OriginResolver resolver_;
    const int upstreamTimeoutMs_;
};

} // namespace relay
} // namespace streamux
