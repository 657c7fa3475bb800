#include "streamux/protocol/HttpResponse.h"

#include <cstdio>
#include <cstring>

namespace streamux {
namespace protocol {

const char* HttpResponse::kServerName = "streamux/1.0";

const char* HttpResponse::ReasonPhrase(HttpStatusCode code) {
    switch (code) {
        case k200Ok: return "OK";
        case k304NotModified: return "Not Modified";
        case k403Forbidden: return "Forbidden";
        case k404NotFound: return "Not Found";
        case k500InternalServerError: return "Internal Server Error";
        case k505HttpVersionNotSupported: return "HTTP Version Not Supported";
        default: return "Unknown";
    }
}

void HttpResponse::setStatusCode(HttpStatusCode code) {
    statusCode_ = code;
    statusMessage_ = ReasonPhrase(code);
}

std::string HttpResponse::getHeader(const std::string& key) const {
    auto it = headers_.find(key);
    return it != headers_.end() ? it->second : std::string();
}

void HttpResponse::setBody(const std::string& body) {
    body_ = body;
    if (body_.empty()) {
        headers_.erase("Content-Length");
    } else {
        addHeader("Content-Length", std::to_string(body_.size()));
    }
}

void HttpResponse::appendToBuffer(streamux::network::Buffer* output) const {
    char buf[32];
    std::snprintf(buf, sizeof buf, "HTTP/1.1 %d ", static_cast<int>(statusCode_));
    output->Append(buf, std::strlen(buf));
    output->Append(statusMessage_);
    output->Append("\r\n");

    for (const auto& header : headers_) {
        output->Append(header.first);
        output->Append(": ");
        output->Append(header.second);
        output->Append("\r\n");
    }

    output->Append("\r\n");
    output->Append(body_);
}

std::string HttpResponse::toString() const {
    streamux::network::Buffer buf(body_.size() + 256);
    appendToBuffer(&buf);
    return buf.RetrieveAllAsString();
}

} // namespace protocol
} // namespace streamux
