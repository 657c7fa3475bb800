#include "streamux/protocol/StreamFramer.h"
#include "streamux/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace streamux {
namespace protocol {

namespace {

// Decimal digits only, no sign, no overflow.
bool ParseNumber(const char* begin, const char* end, uint64_t* out) {
    if (begin == end) return false;
    if (std::any_of(begin, end, [](char c) { return !std::isdigit(static_cast<unsigned char>(c)); })) {
        return false;
    }
    const std::string digits(begin, end);
    errno = 0;
    const unsigned long long v = std::strtoull(digits.c_str(), nullptr, 10);
    if (errno == ERANGE) return false;
    *out = static_cast<uint64_t>(v);
    return true;
}

bool ParseFlag(const char* begin, const char* end, bool* out) {
    if (end - begin != 1 || (*begin != '0' && *begin != '1')) return false;
    *out = (*begin == '1');
    return true;
}

// Longest header "<id>|<flag>|<len>|" the decoder will wait for.
const size_t kMaxHeaderLength = 20 + 1 + 1 + 1 + 20 + 1;

} // namespace

FrameSequence::FrameSequence(uint64_t streamId, std::string payload, size_t maxPayload)
    : streamId_(streamId),
      payload_(std::move(payload)),
      maxPayload_(std::max<size_t>(1, std::min(maxPayload, kMaxFramePayload))),
      offset_(0),
      done_(false) {
}

bool FrameSequence::Next(Frame* frame) {
    if (done_) return false;
    const size_t n = std::min(maxPayload_, payload_.size() - offset_);
    frame->streamId = streamId_;
    frame->payload.assign(payload_, offset_, n);
    offset_ += n;
    frame->endFlag = offset_ >= payload_.size();
    done_ = frame->endFlag;
    return true;
}

std::optional<FrameCodec::Format> FrameCodec::ParseFormat(const std::string& name) {
    if (name == "delimited") return Format::kDelimited;
    if (name == "length") return Format::kLengthPrefixed;
    return std::nullopt;
}

const char* FrameCodec::FormatName(Format format) {
    return format == Format::kDelimited ? "delimited" : "length";
}

std::string FrameCodec::Encode(Format format, const Frame& frame) {
    std::string out;
    out.reserve(frame.payload.size() + 32);
    out.append(std::to_string(frame.streamId));
    out.push_back(kDelimiter);
    out.push_back(frame.endFlag ? '1' : '0');
    out.push_back(kDelimiter);
    if (format == Format::kLengthPrefixed) {
        out.append(std::to_string(frame.payload.size()));
        out.push_back(kDelimiter);
    }
    out.append(frame.payload);
    return out;
}

bool FrameCodec::Decode(Format format, const std::string& unit, Frame* frame) {
    const char* begin = unit.data();
    const char* end = begin + unit.size();

    const char* d1 = std::find(begin, end, kDelimiter);
    if (d1 == end) return false;
    const char* d2 = std::find(d1 + 1, end, kDelimiter);
    if (d2 == end) return false;

    uint64_t id = 0;
    bool flag = false;
    if (!ParseNumber(begin, d1, &id) || !ParseFlag(d1 + 1, d2, &flag)) return false;

    const char* payload = d2 + 1;
    if (format == Format::kLengthPrefixed) {
        const char* d3 = std::find(payload, end, kDelimiter);
        if (d3 == end) return false;
        uint64_t len = 0;
        if (!ParseNumber(payload, d3, &len)) return false;
        payload = d3 + 1;
        if (static_cast<uint64_t>(end - payload) != len) return false;
    }

    frame->streamId = id;
    frame->endFlag = flag;
    frame->payload.assign(payload, end);
    return true;
}

FrameDecoder::Result FrameDecoder::Next(Frame* frame) {
    if (failed_) return Result::kError;

    const char* begin = buffer_.data();
    const char* end = begin + buffer_.size();
    const char* fields[3];
    const char* p = begin;
    for (int i = 0; i < 3; ++i) {
        fields[i] = std::find(p, end, FrameCodec::kDelimiter);
        if (fields[i] == end) {
            if (buffer_.size() > kMaxHeaderLength) {
                LOG_WARN << "FrameDecoder: no frame header within " << kMaxHeaderLength << " bytes";
                failed_ = true;
                return Result::kError;
            }
            return Result::kNeedMore;
        }
        p = fields[i] + 1;
    }

    uint64_t id = 0;
    uint64_t len = 0;
    bool flag = false;
    if (!ParseNumber(begin, fields[0], &id) ||
        !ParseFlag(fields[0] + 1, fields[1], &flag) ||
        !ParseNumber(fields[1] + 1, fields[2], &len) ||
        len > maxPayload_) {
        LOG_WARN << "FrameDecoder: malformed frame header '" << std::string(begin, fields[2]) << "'";
        failed_ = true;
        return Result::kError;
    }

    const size_t headerLen = static_cast<size_t>(fields[2] + 1 - begin);
    if (buffer_.size() - headerLen < len) return Result::kNeedMore;

    frame->streamId = id;
    frame->endFlag = flag;
    frame->payload.assign(buffer_, headerLen, static_cast<size_t>(len));
    buffer_.erase(0, headerLen + static_cast<size_t>(len));
    return Result::kFrame;
}

StreamReassembler::Result StreamReassembler::Add(const Frame& frame) {
    StreamState& state = streams_[frame.streamId];
    if (state.complete) {
        LOG_WARN << "StreamReassembler: frame for finished stream " << frame.streamId;
        return Result::kRejected;
    }
    state.data.append(frame.payload);
    if (frame.endFlag) {
        state.complete = true;
        return Result::kComplete;
    }
    return Result::kPartial;
}

bool StreamReassembler::IsComplete(uint64_t streamId) const {
    auto it = streams_.find(streamId);
    return it != streams_.end() && it->second.complete;
}

std::optional<std::string> StreamReassembler::Take(uint64_t streamId) {
    auto it = streams_.find(streamId);
    if (it == streams_.end() || !it->second.complete || it->second.taken) return std::nullopt;
    it->second.taken = true;
    std::string out;
    out.swap(it->second.data);
    return out;
}

size_t StreamReassembler::completedCount() const {
    return static_cast<size_t>(std::count_if(streams_.begin(), streams_.end(),
        [](const std::pair<const uint64_t, StreamState>& s) { return s.second.complete; }));
}

size_t StreamReassembler::openCount() const {
    return streams_.size() - completedCount();
}

} // namespace protocol
} // namespace streamux
