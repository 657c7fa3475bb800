#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace streamux {
namespace protocol {

// Upper bound for one frame's payload; configuration may only lower it.
const size_t kMaxFramePayload = 1024;

struct Frame {
    uint64_t streamId = 0;
    bool endFlag = false;
    std::string payload;
};

// Splits one payload into frames for a stream, lazily and in order. Every
// frame but the last carries endFlag=false; an empty payload still yields a
// single end frame. A sequence cannot be restarted.
class FrameSequence {
public:
    FrameSequence(uint64_t streamId, std::string payload, size_t maxPayload = kMaxFramePayload);

    // false once the end frame has been handed out.
    bool Next(Frame* frame);
    bool done() const { return done_; }

private:
    const uint64_t streamId_;
    const std::string payload_;
    const size_t maxPayload_;
    size_t offset_;
    bool done_;
};

// Wire encodings of a single frame.
//   kDelimited:      <id>|<flag>|<payload>
//   kLengthPrefixed: <id>|<flag>|<len>|<payload>
// Only the length-prefixed form can be split back out of a byte stream.
class FrameCodec {
public:
    enum class Format {
        kDelimited,
        kLengthPrefixed,
    };

    static constexpr char kDelimiter = '|';

    // Accepts "delimited" and "length".
    static std::optional<Format> ParseFormat(const std::string& name);
    static const char* FormatName(Format format);

    static std::string Encode(Format format, const Frame& frame);
    // Decodes exactly one frame unit whose boundaries are already known.
    static bool Decode(Format format, const std::string& unit, Frame* frame);
};

// Incrementally splits a byte stream of length-prefixed frames.
class FrameDecoder {
public:
    enum class Result {
        kFrame,
        kNeedMore,
        kError,
    };

    explicit FrameDecoder(size_t maxPayload = kMaxFramePayload)
        : maxPayload_(maxPayload) {}

    void Append(const char* data, size_t len) { buffer_.append(data, len); }
    void Append(const std::string& data) { buffer_.append(data); }

    // After kError the stream cannot be resynchronized.
    Result Next(Frame* frame);

    size_t bufferedBytes() const { return buffer_.size(); }

private:
    const size_t maxPayload_;
    std::string buffer_;
    bool failed_{false};
};

// Collects frames per stream id on the receiving side.
class StreamReassembler {
public:
    enum class Result {
        kPartial,
        kComplete,
        // frame arrived after its stream's end frame
        kRejected,
    };

    Result Add(const Frame& frame);

    bool IsComplete(uint64_t streamId) const;
    // Payload of a completed stream; later frames for it stay rejected.
    std::optional<std::string> Take(uint64_t streamId);

    size_t completedCount() const;
    size_t openCount() const;

private:
    struct StreamState {
        std::string data;
        bool complete = false;
        bool taken = false;
    };

    std::map<uint64_t, StreamState> streams_;
};

} // namespace protocol
} // namespace streamux
