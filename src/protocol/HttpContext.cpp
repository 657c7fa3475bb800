#include "streamux/protocol/HttpContext.h"
#include "streamux/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <vector>

namespace streamux {
namespace protocol {

namespace {

const char kCRLF[] = "\r\n";
const char kStreamIdHeader[] = "STREAM-ID";

bool IsBlank(char c) {
    return c == ' ' || c == '\t';
}

// Non-empty run of decimal digits that fits in 64 bits.
std::optional<uint64_t> ParseUnsigned(const std::string& s) {
    if (s.empty()) return std::nullopt;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return std::nullopt;
    }
    errno = 0;
    char* endp = nullptr;
    const unsigned long long v = std::strtoull(s.c_str(), &endp, 10);
    if (errno == ERANGE || endp != s.c_str() + s.size()) return std::nullopt;
    return static_cast<uint64_t>(v);
}

std::string TrimCopy(const char* begin, const char* end) {
    while (begin < end && std::isspace(static_cast<unsigned char>(*begin))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) --end;
    return std::string(begin, end);
}

// Content-Length of a head that failed to parse, so its body can be skipped.
std::optional<uint64_t> ScanContentLength(const char* begin, const char* end) {
    const char* lineStart = begin;
    while (lineStart < end) {
        const char* crlf = std::search(lineStart, end, kCRLF, kCRLF + 2);
        const char* colon = std::find(lineStart, crlf, ':');
        if (colon != crlf) {
            std::string name = TrimCopy(lineStart, colon);
            for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (name == "content-length") {
                return ParseUnsigned(TrimCopy(colon + 1, crlf));
            }
        }
        if (crlf == end) break;
        lineStart = crlf + 2;
    }
    return std::nullopt;
}

} // namespace

bool HttpContext::IsStreamIdName(const char* begin, const char* end) {
    const std::string name = TrimCopy(begin, end);
    if (name.size() != sizeof(kStreamIdHeader) - 1) return false;
    for (size_t i = 0; i < name.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(name[i])) != kStreamIdHeader[i]) return false;
    }
    return true;
}

void HttpContext::processStreamId(const char* begin, const char* end) {
    const std::string value = TrimCopy(begin, end);
    std::optional<uint64_t> id = ParseUnsigned(value);
    if (!id) {
        LOG_DEBUG << "HttpContext ignoring invalid STREAM-ID '" << value << "'";
    }
    request_.setStreamId(id);
}

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    std::vector<std::pair<const char*, const char*>> tokens;
    const char* p = begin;
    while (p < end) {
        while (p < end && IsBlank(*p)) ++p;
        if (p == end) break;
        const char* tokenEnd = p;
        while (tokenEnd < end && !IsBlank(*tokenEnd)) ++tokenEnd;
        tokens.emplace_back(p, tokenEnd);
        p = tokenEnd;
    }
    if (tokens.size() != 3) {
        error_ = "request line has " + std::to_string(tokens.size()) + " tokens: '" +
                 std::string(begin, end) + "'";
        return false;
    }

    request_.setMethod(tokens[0].first, tokens[0].second);
    const char* target = tokens[1].first;
    const char* targetEnd = tokens[1].second;
    const char* question = std::find(target, targetEnd, '?');
    request_.setPath(target, question);
    request_.setQuery(question, targetEnd);
    request_.setVersion(tokens[2].first, tokens[2].second);
    request_.appendRawLine(begin, end);
    return true;
}

bool HttpContext::processHead(const char* begin, const char* end) {
    bool sawRequestLine = false;
    const char* lineStart = begin;
    while (lineStart < end) {
        const char* crlf = std::search(lineStart, end, kCRLF, kCRLF + 2);
        if (crlf == end) break;
        const char* colon = std::find(lineStart, crlf, ':');
        const bool streamIdLine = colon != crlf && IsStreamIdName(lineStart, colon);

        if (streamIdLine) {
            processStreamId(colon + 1, crlf);
        } else if (!sawRequestLine) {
            if (!processRequestLine(lineStart, crlf)) return false;
            sawRequestLine = true;
        } else if (colon == crlf) {
            error_ = "header line without colon: '" + std::string(lineStart, crlf) + "'";
            return false;
        } else {
            request_.addHeader(lineStart, colon, crlf);
            request_.appendRawLine(lineStart, crlf);
        }
        lineStart = crlf + 2;
    }

    if (!sawRequestLine) {
        error_ = "missing request line";
        return false;
    }

    const std::string cl = request_.getHeader("Content-Length");
    if (!cl.empty()) {
        std::optional<uint64_t> len = ParseUnsigned(cl);
        if (!len) {
            error_ = "invalid Content-Length '" + cl + "'";
            return false;
        }
        bodyRemaining_ = static_cast<size_t>(*len);
    }
    return true;
}

void HttpContext::skipBodyOf(const char* begin, const char* end) {
    std::optional<uint64_t> len = ScanContentLength(begin, end);
    if (len) {
        discardRemaining_ = static_cast<size_t>(*len);
    }
}

// return false if any error
bool HttpContext::parseRequest(streamux::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    (void)receiveTime;
    bool ok = true;
    bool hasMore = true;
    while (hasMore) {
        if (state_ == kExpectHead && discardRemaining_ > 0) {
            const size_t n = std::min(buf->ReadableBytes(), discardRemaining_);
            buf->Retrieve(n);
            discardRemaining_ -= n;
            if (discardRemaining_ > 0) {
                hasMore = false;
            }
        } else if (state_ == kExpectHead) {
            // empty lines between messages
            while (buf->ReadableBytes() >= 2 && buf->Peek()[0] == '\r' && buf->Peek()[1] == '\n') {
                buf->Retrieve(2);
            }
            const char* headEnd = buf->FindHeadEnd();
            if (headEnd == nullptr) {
                if (buf->ReadableBytes() > maxHeaderBytes_) {
                    error_ = "header block exceeds " + std::to_string(maxHeaderBytes_) + " bytes";
                    buf->RetrieveAll();
                    ok = false;
                }
                hasMore = false;
            } else if (static_cast<size_t>(headEnd - buf->Peek()) > maxHeaderBytes_) {
                error_ = "header block exceeds " + std::to_string(maxHeaderBytes_) + " bytes";
                skipBodyOf(buf->Peek(), headEnd + 2);
                buf->RetrieveUntil(headEnd + 4);
                ok = false;
                hasMore = false;
            } else {
                // Keep the CRLF that ends the last header line.
                ok = processHead(buf->Peek(), headEnd + 2);
                if (!ok) {
                    skipBodyOf(buf->Peek(), headEnd + 2);
                }
                buf->RetrieveUntil(headEnd + 4);
                if (!ok) {
                    hasMore = false;
                } else if (bodyRemaining_ > 0) {
                    state_ = kExpectBody;
                } else {
                    state_ = kGotAll;
                    hasMore = false;
                }
            }
        } else if (state_ == kExpectBody) {
            const size_t n = std::min(buf->ReadableBytes(), bodyRemaining_);
            request_.appendBody(buf->Peek(), n);
            buf->Retrieve(n);
            bodyRemaining_ -= n;
            if (bodyRemaining_ == 0) {
                state_ = kGotAll;
            }
            hasMore = false;
        } else {
            hasMore = false;
        }
    }
    return ok;
}

} // namespace protocol
} // namespace streamux
