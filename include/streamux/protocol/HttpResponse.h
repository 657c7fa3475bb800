#pragma once

#include <map>
#include <string>

#include "streamux/network/Buffer.h"

namespace streamux {
namespace protocol {

class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k304NotModified = 304,
        k403Forbidden = 403,
        k404NotFound = 404,
        k500InternalServerError = 500,
        k505HttpVersionNotSupported = 505,
    };

    static const char* kServerName;

    HttpResponse()
        : statusCode_(kUnknown) {}

    // Also sets the standard reason phrase.
    void setStatusCode(HttpStatusCode code);
    HttpStatusCode statusCode() const { return statusCode_; }
    const std::string& statusMessage() const { return statusMessage_; }

    void setContentType(const std::string& contentType) { addHeader("Content-Type", contentType); }
    void addHeader(const std::string& key, const std::string& value) { headers_[key] = value; }
    std::string getHeader(const std::string& key) const;
    const std::map<std::string, std::string>& headers() const { return headers_; }

    // Adds Content-Length alongside a non-empty body.
    void setBody(const std::string& body);
    const std::string& body() const { return body_; }

    void appendToBuffer(streamux::network::Buffer* output) const;
    std::string toString() const;

    static const char* ReasonPhrase(HttpStatusCode code);

private:
    HttpStatusCode statusCode_;
    std::string statusMessage_;
    std::map<std::string, std::string> headers_;
    std::string body_;
};

} // namespace protocol
} // namespace streamux
