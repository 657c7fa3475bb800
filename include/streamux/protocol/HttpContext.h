#pragma once

#include "streamux/protocol/HttpRequest.h"
#include "streamux/network/Buffer.h"

#include <chrono>
#include <string>

namespace streamux {
namespace protocol {

// Incremental request parser bound to one connection's input buffer.
//
// Typical use:
//   while (true) {
//       if (!ctx.parseRequest(buf, now)) { log ctx.error(); ctx.reset(); continue; }
//       if (!ctx.gotAll()) break;
//       dispatch(ctx.request());
//       ctx.reset();
//   }
// A failed parse has always consumed the offending bytes, including a body
// announced by Content-Length, so the loop makes progress and the connection
// stays usable.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectHead,
        kExpectBody,
        kGotAll,
    };

    static constexpr size_t kDefaultMaxHeaderBytes = 64 * 1024;

    explicit HttpContext(size_t maxHeaderBytes = kDefaultMaxHeaderBytes)
        : state_(kExpectHead),
          maxHeaderBytes_(maxHeaderBytes) {}

    // return false if the current message is malformed
    bool parseRequest(streamux::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    void reset() {
        state_ = kExpectHead;
        HttpRequest dummy;
        request_.swap(dummy);
        bodyRemaining_ = 0;
        error_.clear();
    }

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

    // Why the last parseRequest() failed.
    const std::string& error() const { return error_; }

private:
    bool processHead(const char* begin, const char* end);
    bool processRequestLine(const char* begin, const char* end);
    void processStreamId(const char* begin, const char* end);
    static bool IsStreamIdName(const char* begin, const char* end);
    void skipBodyOf(const char* begin, const char* end);

    HttpRequestParseState state_;
    HttpRequest request_;
    const size_t maxHeaderBytes_;
    size_t bodyRemaining_{0};
    // Body bytes of a dropped message still to be skipped; survives reset().
    size_t discardRemaining_{0};
    std::string error_;
};

} // namespace protocol
} // namespace streamux
