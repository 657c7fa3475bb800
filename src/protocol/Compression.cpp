#include "streamux/protocol/Compression.h"
#include "streamux/common/Logger.h"

#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace streamux {
namespace protocol {

namespace {

const size_t kChunk = 16384;

int WindowBits(Compression::Encoding enc) {
    // +16 selects the gzip wrapper instead of the zlib one.
    return enc == Compression::Encoding::kGzip ? 16 + MAX_WBITS : MAX_WBITS;
}

std::string Trim(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// q-value of one Accept-Encoding item; 1 when absent.
double QValue(const std::string& params) {
    std::string p = params;
    std::transform(p.begin(), p.end(), p.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const size_t q = p.find("q=");
    if (q == std::string::npos) return 1.0;
    return std::strtod(p.c_str() + q + 2, nullptr);
}

bool Deflate(const std::string& in, int windowBits, std::string* out) {
    z_stream zs;
    std::memset(&zs, 0, sizeof zs);
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        LOG_ERROR << "deflateInit2 failed";
        return false;
    }
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());

    out->clear();
    char buf[kChunk];
    int ret;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof buf;
        ret = deflate(&zs, Z_FINISH);
        if (ret == Z_STREAM_ERROR) break;
        out->append(buf, sizeof buf - zs.avail_out);
    } while (ret != Z_STREAM_END);
    deflateEnd(&zs);
    return ret == Z_STREAM_END;
}

bool Inflate(const std::string& in, int windowBits, std::string* out) {
    z_stream zs;
    std::memset(&zs, 0, sizeof zs);
    if (inflateInit2(&zs, windowBits) != Z_OK) {
        LOG_ERROR << "inflateInit2 failed";
        return false;
    }
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());

    out->clear();
    char buf[kChunk];
    int ret;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof buf;
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) break;
        out->append(buf, sizeof buf - zs.avail_out);
        // Truncated input: nothing left to feed and no progress made.
        if (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) break;
    } while (ret != Z_STREAM_END);
    inflateEnd(&zs);
    return ret == Z_STREAM_END;
}

} // namespace

Compression::Encoding Compression::Negotiate(const std::string& acceptEncoding) {
    bool gzip = false;
    bool deflate = false;
    std::stringstream ss(acceptEncoding);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const size_t semi = item.find(';');
        std::string coding = Trim(item.substr(0, semi));
        std::transform(coding.begin(), coding.end(), coding.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        const bool accepted = semi == std::string::npos || QValue(item.substr(semi + 1)) > 0.0;
        if (!accepted) continue;
        if (coding == "gzip" || coding == "x-gzip") gzip = true;
        else if (coding == "deflate") deflate = true;
    }
    if (gzip) return Encoding::kGzip;
    if (deflate) return Encoding::kDeflate;
    return Encoding::kIdentity;
}

const char* Compression::Name(Encoding enc) {
    switch (enc) {
        case Encoding::kGzip: return "gzip";
        case Encoding::kDeflate: return "deflate";
        default: return "identity";
    }
}

bool Compression::Compress(Encoding enc, const std::string& in, std::string* out) {
    if (enc == Encoding::kIdentity) {
        *out = in;
        return true;
    }
    return Deflate(in, WindowBits(enc), out);
}

bool Compression::Decompress(Encoding enc, const std::string& in, std::string* out) {
    if (enc == Encoding::kIdentity) {
        *out = in;
        return true;
    }
    return Inflate(in, WindowBits(enc), out);
}

} // namespace protocol
} // namespace streamux
