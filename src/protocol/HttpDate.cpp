#include "streamux/protocol/HttpDate.h"

#include <cstring>

namespace streamux {
namespace protocol {

static const char kImfFixdate[] = "%a, %d %b %Y %H:%M:%S GMT";

std::string HttpDate::Format(time_t t) {
    struct tm tmBuf;
    gmtime_r(&t, &tmBuf);
    char buf[64];
    const size_t n = std::strftime(buf, sizeof buf, kImfFixdate, &tmBuf);
    return std::string(buf, n);
}

std::string HttpDate::Now() {
    return Format(::time(nullptr));
}

std::optional<time_t> HttpDate::Parse(const std::string& value) {
    struct tm tmBuf;
    std::memset(&tmBuf, 0, sizeof tmBuf);
    const char* end = ::strptime(value.c_str(), kImfFixdate, &tmBuf);
    if (end == nullptr || *end != '\0') {
        return std::nullopt;
    }
    // strptime takes "6 Nov", a wrong weekday or "31 Feb" and timegm
    // normalizes them; only the canonical spelling of the instant is valid.
    const time_t t = ::timegm(&tmBuf);
    if (t == static_cast<time_t>(-1) || Format(t) != value) {
        return std::nullopt;
    }
    return t;
}

} // namespace protocol
} // namespace streamux
