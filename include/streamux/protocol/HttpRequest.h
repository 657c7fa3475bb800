#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace streamux {
namespace protocol {

// One parsed request message. Header names are stored in canonical case
// ("if-modified-since" becomes "If-Modified-Since"); a repeated header keeps
// its last value. The STREAM-ID line never appears among the headers.
class HttpRequest {
public:
    HttpRequest() = default;

    void setMethod(const char* start, const char* end) { method_.assign(start, end); }
    const std::string& method() const { return method_; }

    void setPath(const char* start, const char* end) { path_.assign(start, end); }
    const std::string& path() const { return path_; }

    // Includes the leading '?', empty when the target had no query.
    void setQuery(const char* start, const char* end) { query_.assign(start, end); }
    const std::string& query() const { return query_; }

    void setVersion(const char* start, const char* end) { version_.assign(start, end); }
    const std::string& version() const { return version_; }

    void addHeader(const char* start, const char* colon, const char* end) {
        std::string field(start, colon);
        ++colon;
        while (colon < end && std::isspace(static_cast<unsigned char>(*colon))) {
            ++colon;
        }
        std::string value(colon, end);
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
            value.pop_back();
        }
        headers_[CanonicalName(field)] = value;
    }

    // Looks the field up by its canonical form, so any casing works.
    std::string getHeader(const std::string& field) const {
        auto it = headers_.find(CanonicalName(field));
        return it != headers_.end() ? it->second : std::string();
    }

    bool hasHeader(const std::string& field) const {
        return headers_.count(CanonicalName(field)) != 0;
    }

    const std::map<std::string, std::string>& headers() const { return headers_; }

    void setStreamId(std::optional<uint64_t> id) { streamId_ = id; }
    const std::optional<uint64_t>& streamId() const { return streamId_; }
    bool multiplexed() const { return streamId_.has_value(); }

    // Request line and header lines exactly as received, CRLF-terminated,
    // without the STREAM-ID line and without the blank line.
    void appendRawLine(const char* start, const char* end) {
        rawHead_.append(start, end);
        rawHead_.append("\r\n");
    }
    const std::string& rawHead() const { return rawHead_; }

    void setBody(const std::string& body) { body_ = body; }
    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    void swap(HttpRequest& that) {
        method_.swap(that.method_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        version_.swap(that.version_);
        headers_.swap(that.headers_);
        std::swap(streamId_, that.streamId_);
        rawHead_.swap(that.rawHead_);
        body_.swap(that.body_);
    }

    static std::string CanonicalName(const std::string& field) {
        std::string out;
        out.reserve(field.size());
        bool upper = true;
        for (unsigned char c : field) {
            out.push_back(static_cast<char>(upper ? std::toupper(c) : std::tolower(c)));
            upper = (c == '-');
        }
        return out;
    }

private:
    std::string method_;
    std::string path_;
    std::string query_;
    std::string version_;
    std::map<std::string, std::string> headers_;
    std::optional<uint64_t> streamId_;
    std::string rawHead_;
    std::string body_;
};

} // namespace protocol
} // namespace streamux
