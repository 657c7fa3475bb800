#include "streamux/protocol/StreamFramer.h"
#include "streamux/common/Logger.h"

#include <cassert>
#include <string>
#include <vector>

using namespace streamux::protocol;
using namespace streamux::common;

namespace {

std::vector<Frame> Split(uint64_t id, const std::string& payload, size_t maxPayload = kMaxFramePayload) {
    std::vector<Frame> frames;
    FrameSequence seq(id, payload, maxPayload);
    Frame f;
    while (seq.Next(&f)) frames.push_back(f);
    assert(seq.done());
    return frames;
}

} // namespace

void testSplitSizes() {
    // 2500 bytes -> 1024 + 1024 + 452, only the last carries the end flag
    std::vector<Frame> frames = Split(3, std::string(2500, 'a'));
    assert(frames.size() == 3);
    assert(frames[0].payload.size() == 1024 && !frames[0].endFlag);
    assert(frames[1].payload.size() == 1024 && !frames[1].endFlag);
    assert(frames[2].payload.size() == 452 && frames[2].endFlag);
    for (const auto& f : frames) assert(f.streamId == 3);

    // exactly one frame's worth
    frames = Split(1, std::string(1024, 'b'));
    assert(frames.size() == 1 && frames[0].endFlag);

    // empty payload still terminates the stream
    frames = Split(9, "");
    assert(frames.size() == 1);
    assert(frames[0].endFlag && frames[0].payload.empty());

    // configured smaller limit; larger ones are clamped
    frames = Split(2, "abcdefg", 3);
    assert(frames.size() == 3);
    assert(frames[0].payload == "abc" && frames[1].payload == "def" && frames[2].payload == "g");
    frames = Split(2, std::string(2048, 'c'), 4096);
    assert(frames.size() == 2);
    LOG_INFO << "testSplitSizes PASS";
}

void testEncodeDecode() {
    Frame f;
    f.streamId = 12;
    f.endFlag = true;
    f.payload = "HTTP/1.1 200 OK\r\n\r\na|b";

    const std::string delimited = FrameCodec::Encode(FrameCodec::Format::kDelimited, f);
    assert(delimited == "12|1|HTTP/1.1 200 OK\r\n\r\na|b");
    const std::string prefixed = FrameCodec::Encode(FrameCodec::Format::kLengthPrefixed, f);
    assert(prefixed == "12|1|22|HTTP/1.1 200 OK\r\n\r\na|b");

    Frame out;
    assert(FrameCodec::Decode(FrameCodec::Format::kDelimited, delimited, &out));
    assert(out.streamId == 12 && out.endFlag && out.payload == f.payload);
    assert(FrameCodec::Decode(FrameCodec::Format::kLengthPrefixed, prefixed, &out));
    assert(out.payload == f.payload);

    assert(!FrameCodec::Decode(FrameCodec::Format::kDelimited, "12|2|x", &out));
    assert(!FrameCodec::Decode(FrameCodec::Format::kDelimited, "x|1|x", &out));
    assert(!FrameCodec::Decode(FrameCodec::Format::kLengthPrefixed, "1|0|5|abc", &out));

    assert(FrameCodec::ParseFormat("delimited") == FrameCodec::Format::kDelimited);
    assert(FrameCodec::ParseFormat("length") == FrameCodec::Format::kLengthPrefixed);
    assert(!FrameCodec::ParseFormat("json"));
    LOG_INFO << "testEncodeDecode PASS";
}

void testDecoderAcrossChunks() {
    std::string wire;
    for (const auto& f : Split(1, std::string(1500, 'x'))) {
        wire += FrameCodec::Encode(FrameCodec::Format::kLengthPrefixed, f);
    }
    for (const auto& f : Split(2, "short")) {
        wire += FrameCodec::Encode(FrameCodec::Format::kLengthPrefixed, f);
    }

    // Feed byte by byte to cover every split point of header and payload.
    FrameDecoder decoder;
    std::vector<Frame> frames;
    for (char c : wire) {
        decoder.Append(&c, 1);
        Frame f;
        FrameDecoder::Result r;
        while ((r = decoder.Next(&f)) == FrameDecoder::Result::kFrame) frames.push_back(f);
        assert(r == FrameDecoder::Result::kNeedMore);
    }
    assert(frames.size() == 3);
    assert(frames[0].streamId == 1 && frames[0].payload.size() == 1024 && !frames[0].endFlag);
    assert(frames[1].streamId == 1 && frames[1].payload.size() == 476 && frames[1].endFlag);
    assert(frames[2].streamId == 2 && frames[2].payload == "short" && frames[2].endFlag);
    assert(decoder.bufferedBytes() == 0);
    LOG_INFO << "testDecoderAcrossChunks PASS";
}

void testDecoderErrors() {
    FrameDecoder oversize;
    oversize.Append("1|0|2048|");
    Frame f;
    assert(oversize.Next(&f) == FrameDecoder::Result::kError);
    // sticky
    oversize.Append("1|1|0|");
    assert(oversize.Next(&f) == FrameDecoder::Result::kError);

    FrameDecoder junk;
    junk.Append(std::string(100, 'z'));
    assert(junk.Next(&f) == FrameDecoder::Result::kError);
    LOG_INFO << "testDecoderErrors PASS";
}

void testReassembler() {
    StreamReassembler r;
    Frame a1{1, false, "hel"};
    Frame b1{2, true, "other"};
    Frame a2{1, true, "lo"};

    assert(r.Add(a1) == StreamReassembler::Result::kPartial);
    assert(r.Add(b1) == StreamReassembler::Result::kComplete);
    assert(!r.IsComplete(1));
    assert(!r.Take(1));
    assert(r.openCount() == 1 && r.completedCount() == 1);

    assert(r.Add(a2) == StreamReassembler::Result::kComplete);
    assert(r.Take(1) == std::string("hello"));
    assert(r.Take(2) == std::string("other"));
    assert(!r.Take(1));

    // A frame after the end frame is a protocol violation.
    assert(r.Add(a2) == StreamReassembler::Result::kRejected);
    assert(r.completedCount() == 2 && r.openCount() == 0);
    LOG_INFO << "testReassembler PASS";
}

int main() {
    testSplitSizes();
    testEncodeDecode();
    testDecoderAcrossChunks();
    testDecoderErrors();
    testReassembler();
    LOG_INFO << "All StreamFramer tests passed";
    return 0;
}
