#include "streamux/protocol/Compression.h"
#include "streamux/common/Logger.h"

#include <cassert>
#include <string>

using namespace streamux::protocol;
using namespace streamux::common;

void testNegotiate() {
    using E = Compression::Encoding;
    assert(Compression::Negotiate("") == E::kIdentity);
    assert(Compression::Negotiate("gzip") == E::kGzip);
    assert(Compression::Negotiate("deflate, gzip;q=0.5") == E::kGzip);
    assert(Compression::Negotiate("GZIP;q=0, deflate") == E::kDeflate);
    assert(Compression::Negotiate("br, identity") == E::kIdentity);
    assert(std::string(Compression::Name(E::kGzip)) == "gzip");
    LOG_INFO << "testNegotiate PASS";
}

void testGzipBody() {
    std::string body;
    for (int i = 0; i < 200; ++i) body += "<p>line " + std::to_string(i) + "</p>\n";

    std::string packed;
    assert(Compression::Compress(Compression::Encoding::kGzip, body, &packed));
    assert(packed.size() < body.size());
    // gzip magic
    assert(static_cast<unsigned char>(packed[0]) == 0x1f);
    assert(static_cast<unsigned char>(packed[1]) == 0x8b);

    std::string unpacked;
    assert(Compression::Decompress(Compression::Encoding::kGzip, packed, &unpacked));
    assert(unpacked == body);

    // A truncated stream is an error, not a short body.
    std::string partial;
    assert(!Compression::Decompress(Compression::Encoding::kGzip, packed.substr(0, packed.size() / 2), &partial));
    LOG_INFO << "testGzipBody PASS";
}

int main() {
    testNegotiate();
    testGzipBody();
    LOG_INFO << "All Compression tests passed";
    return 0;
}
