#pragma once

#include "streamux/network/InetAddress.h"
#include "streamux/protocol/HttpRequest.h"

#include <cstdint>
#include <optional>
#include <string>

namespace streamux {
namespace relay {

// Picks the origin server a proxied request goes to: the pinned origin when
// one is configured, otherwise the request's Host header.
class OriginResolver {
public:
    struct Origin {
        std::string host;
        uint16_t port = 80;
    };

    static const uint16_t kDefaultPort = 80;

    OriginResolver() = default;
    explicit OriginResolver(Origin pinned)
        : pinned_(std::move(pinned)) {}

    // *error explains a nullopt result.
    std::optional<Origin> Select(const protocol::HttpRequest& req, std::string* error) const;
    std::optional<network::InetAddress> Resolve(const Origin& origin, std::string* error) const;

    // "host", "host:port"; nullopt on an empty host or a bad port.
    static std::optional<Origin> ParseHostHeader(const std::string& value);

    bool pinned() const { return pinned_.has_value(); }

private:
    std::optional<Origin> pinned_;
};

} // namespace relay
} // namespace streamux
