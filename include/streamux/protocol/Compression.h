#pragma once

#include <string>

namespace streamux {
namespace protocol {

// zlib-backed content codings for response bodies.
class Compression {
public:
    enum class Encoding {
        kIdentity,
        kGzip,
        kDeflate,
    };

    // Best coding the client offers in Accept-Encoding; gzip wins over deflate.
    // A coding listed with q=0 counts as refused.
    static Encoding Negotiate(const std::string& acceptEncoding);
    static const char* Name(Encoding enc);

    static bool Compress(Encoding enc, const std::string& in, std::string* out);
    static bool Decompress(Encoding enc, const std::string& in, std::string* out);
};

} // namespace protocol
} // namespace streamux
