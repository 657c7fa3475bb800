#include "streamux/server/ResponseWriter.h"
#include "streamux/server/StreamSession.h"
#include "streamux/protocol/StreamFramer.h"
#include "streamux/common/Logger.h"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace streamux::server;
using namespace streamux::protocol;
using namespace streamux::common;

namespace {

// Records every unit the session hands to the transport, in order.
struct RecordingSink {
    std::mutex mutex;
    std::vector<std::string> units;
    std::atomic<bool> open{true};

    StreamSession::Sink AsSink() {
        return [this](const std::string& unit) {
            if (!open) return false;
            std::lock_guard<std::mutex> lock(mutex);
            units.push_back(unit);
            return true;
        };
    }

    std::string Joined() {
        std::lock_guard<std::mutex> lock(mutex);
        std::string all;
        for (const auto& u : units) all += u;
        return all;
    }
};

} // namespace

void testPlainWriterSingleUnit() {
    RecordingSink sink;
    auto session = std::make_shared<StreamSession>("plain", sink.AsSink());

    PlainResponseWriter writer(session);
    assert(writer.Write("HTTP/1.1 200 OK\r\n"));
    assert(writer.Write("\r\nbody"));
    assert(sink.units.empty());
    assert(writer.Finish());
    assert(sink.units.size() == 1);
    assert(sink.units[0] == "HTTP/1.1 200 OK\r\n\r\nbody");
    assert(!writer.Finish());
    LOG_INFO << "testPlainWriterSingleUnit PASS";
}

void testFramedWriterChunking() {
    RecordingSink sink;
    auto session = std::make_shared<StreamSession>("framed", sink.AsSink());

    FramedResponseWriter writer(session, 5, FrameCodec::Format::kLengthPrefixed);
    assert(writer.Write(std::string(1000, 'a')));
    assert(writer.framesSent() == 0);
    // 1000 + 1100 = 2100 pending -> two full frames out, 52 held back
    assert(writer.Write(std::string(1100, 'b')));
    assert(writer.framesSent() == 2);
    assert(writer.Finish());
    assert(writer.framesSent() == 3);

    FrameDecoder decoder;
    decoder.Append(sink.Joined());
    Frame f;
    std::vector<Frame> frames;
    while (decoder.Next(&f) == FrameDecoder::Result::kFrame) frames.push_back(f);
    assert(frames.size() == 3);
    assert(!frames[0].endFlag && !frames[1].endFlag && frames[2].endFlag);
    assert(frames[2].payload.size() == 52);
    assert(frames[0].payload + frames[1].payload + frames[2].payload ==
           std::string(1000, 'a') + std::string(1100, 'b'));
    LOG_INFO << "testFramedWriterChunking PASS";
}

void testFramedWriterExactMultiple() {
    RecordingSink sink;
    auto session = std::make_shared<StreamSession>("exact", sink.AsSink());

    FramedResponseWriter writer(session, 1, FrameCodec::Format::kDelimited, 4);
    assert(writer.Write("abcdefgh"));
    assert(writer.Finish());
    // The end flag lands on the final data frame, not on an extra empty one.
    assert(sink.units.size() == 2);
    assert(sink.units[0] == "1|0|abcd");
    assert(sink.units[1] == "1|1|efgh");

    FramedResponseWriter empty(session, 2, FrameCodec::Format::kDelimited);
    assert(empty.Finish());
    assert(sink.units.back() == "2|1|");
    LOG_INFO << "testFramedWriterExactMultiple PASS";
}

void testWriteAfterClose() {
    RecordingSink sink;
    auto session = std::make_shared<StreamSession>("closed", sink.AsSink());

    FramedResponseWriter writer(session, 1, FrameCodec::Format::kLengthPrefixed);
    session->MarkClosed();
    assert(!writer.Write(std::string(3000, 'x')));
    assert(!writer.Finish());
    assert(sink.units.empty());

    RecordingSink gone;
    auto session2 = std::make_shared<StreamSession>("gone", gone.AsSink());
    gone.open = false;
    PlainResponseWriter plain(session2);
    assert(plain.Write("data"));
    assert(!plain.Finish());
    LOG_INFO << "testWriteAfterClose PASS";
}

void testSessionLifecycle() {
    RecordingSink sink;
    StreamSession session("life", sink.AsSink());
    assert(session.state() == StreamSession::kOpen);

    session.BeginRequest();
    session.BeginRequest();
    assert(session.inflight() == 2);
    assert(!session.EndRequest());

    // Peer half-closed with one request still running.
    assert(!session.MarkClosing());
    assert(session.state() == StreamSession::kClosing);
    assert(session.Write("late response"));
    assert(session.EndRequest());
    assert(session.inflight() == 0);

    StreamSession idle("idle", sink.AsSink());
    assert(idle.MarkClosing());
    assert(!idle.MarkClosing());
    idle.MarkClosed();
    assert(!idle.Write("x"));
    assert(std::string(StreamSession::StateToString(idle.state())) == "CLOSED");
    LOG_INFO << "testSessionLifecycle PASS";
}

void testConcurrentStreamsNeverInterleave() {
    RecordingSink sink;
    auto session = std::make_shared<StreamSession>("concurrent", sink.AsSink());

    const int kStreams = 16;
    const size_t kBodySize = 5000;
    std::vector<std::thread> threads;
    for (int i = 0; i < kStreams; ++i) {
        threads.emplace_back([session, i, kBodySize]() {
            FramedResponseWriter writer(session, static_cast<uint64_t>(i),
                                        FrameCodec::Format::kLengthPrefixed);
            const std::string body(kBodySize, static_cast<char>('A' + i));
            // Uneven chunks so frame boundaries differ from write boundaries.
            size_t offset = 0;
            size_t chunk = 333;
            while (offset < body.size()) {
                const size_t n = std::min(chunk, body.size() - offset);
                assert(writer.Write(body.substr(offset, n)));
                offset += n;
                chunk += 111;
            }
            assert(writer.Finish());
        });
    }
    for (auto& t : threads) t.join();

    FrameDecoder decoder;
    decoder.Append(sink.Joined());
    StreamReassembler reassembler;
    Frame f;
    FrameDecoder::Result r;
    while ((r = decoder.Next(&f)) == FrameDecoder::Result::kFrame) {
        assert(f.payload.size() <= kMaxFramePayload);
        assert(reassembler.Add(f) != StreamReassembler::Result::kRejected);
    }
    assert(r == FrameDecoder::Result::kNeedMore);
    assert(decoder.bufferedBytes() == 0);
    assert(reassembler.completedCount() == static_cast<size_t>(kStreams));
    for (int i = 0; i < kStreams; ++i) {
        auto body = reassembler.Take(static_cast<uint64_t>(i));
        assert(body && *body == std::string(kBodySize, static_cast<char>('A' + i)));
    }
    LOG_INFO << "testConcurrentStreamsNeverInterleave PASS";
}

int main() {
    testPlainWriterSingleUnit();
    testFramedWriterChunking();
    testFramedWriterExactMultiple();
    testWriteAfterClose();
    testSessionLifecycle();
    testConcurrentStreamsNeverInterleave();
    LOG_INFO << "All ResponseWriter tests passed";
    return 0;
}
