#include "streamux/relay/OriginResolver.h"

#include <cctype>
#include <cstdlib>

namespace streamux {
namespace relay {

std::optional<OriginResolver::Origin> OriginResolver::ParseHostHeader(const std::string& value) {
    size_t b = 0;
    size_t e = value.size();
    while (b < e && std::isspace(static_cast<unsigned char>(value[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(value[e - 1]))) --e;
    const std::string hostport = value.substr(b, e - b);

    Origin origin;
    const size_t colon = hostport.rfind(':');
    if (colon == std::string::npos) {
        origin.host = hostport;
        origin.port = kDefaultPort;
    } else {
        origin.host = hostport.substr(0, colon);
        const std::string portStr = hostport.substr(colon + 1);
        if (portStr.empty() || portStr.size() > 5) return std::nullopt;
        for (unsigned char c : portStr) {
            if (!std::isdigit(c)) return std::nullopt;
        }
        const long port = std::strtol(portStr.c_str(), nullptr, 10);
        if (port <= 0 || port > 65535) return std::nullopt;
        origin.port = static_cast<uint16_t>(port);
    }
    if (origin.host.empty()) return std::nullopt;
    return origin;
}

std::optional<OriginResolver::Origin> OriginResolver::Select(const protocol::HttpRequest& req,
                                                             std::string* error) const {
    if (pinned_) return pinned_;

    if (!req.hasHeader("Host")) {
        *error = "request has no Host header";
        return std::nullopt;
    }
    const std::string host = req.getHeader("Host");
    std::optional<Origin> origin = ParseHostHeader(host);
    if (!origin) {
        *error = "invalid Host header '" + host + "'";
    }
    return origin;
}

std::optional<network::InetAddress> OriginResolver::Resolve(const Origin& origin, std::string* error) const {
    std::optional<network::InetAddress> addr = network::InetAddress::Resolve(origin.host, origin.port);
    if (!addr) {
        *error = "cannot resolve origin host '" + origin.host + "'";
    }
    return addr;
}

} // namespace relay
} // namespace streamux
