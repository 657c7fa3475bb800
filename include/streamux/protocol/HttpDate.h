#pragma once

#include <ctime>
#include <optional>
#include <string>

namespace streamux {
namespace protocol {

// RFC 7231 IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
class HttpDate {
public:
    static std::string Format(time_t t);
    static std::string Now();
    // nullopt unless the whole string is a valid IMF-fixdate.
    static std::optional<time_t> Parse(const std::string& value);
};

} // namespace protocol
} // namespace streamux
