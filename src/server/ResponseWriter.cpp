#include "streamux/server/ResponseWriter.h"
#include "streamux/server/StreamSession.h"
#include "streamux/common/Logger.h"

#include <algorithm>

namespace streamux {
namespace server {

PlainResponseWriter::PlainResponseWriter(std::shared_ptr<StreamSession> session)
    : session_(std::move(session)) {
}

bool PlainResponseWriter::Write(const std::string& data) {
    if (finished_) return false;
    pending_.append(data);
    return true;
}

bool PlainResponseWriter::Finish() {
    if (finished_) return false;
    finished_ = true;
    if (!session_->Write(pending_)) {
        LOG_DEBUG << "PlainResponseWriter[" << session_->name() << "] transport gone, dropped "
                  << pending_.size() << " bytes";
        return false;
    }
    return true;
}

FramedResponseWriter::FramedResponseWriter(std::shared_ptr<StreamSession> session,
                                           uint64_t streamId,
                                           protocol::FrameCodec::Format format,
                                           size_t maxPayload)
    : session_(std::move(session)),
      streamId_(streamId),
      format_(format),
      maxPayload_(std::max<size_t>(1, std::min(maxPayload, protocol::kMaxFramePayload))) {
}

bool FramedResponseWriter::SendFrame(const protocol::Frame& frame) {
    if (!session_->Write(protocol::FrameCodec::Encode(format_, frame))) {
        LOG_DEBUG << "FramedResponseWriter[" << session_->name() << "] stream " << streamId_
                  << " abandoned after " << framesSent_ << " frames";
        failed_ = true;
        return false;
    }
    ++framesSent_;
    return true;
}

bool FramedResponseWriter::Write(const std::string& data) {
    if (failed_ || finished_) return false;
    pending_.append(data);

    // Strictly more than one frame's worth: the remainder stays for Finish().
    size_t offset = 0;
    while (pending_.size() - offset > maxPayload_) {
        protocol::Frame frame;
        frame.streamId = streamId_;
        frame.endFlag = false;
        frame.payload.assign(pending_, offset, maxPayload_);
        offset += maxPayload_;
        if (!SendFrame(frame)) return false;
    }
    pending_.erase(0, offset);
    return true;
}

bool FramedResponseWriter::Finish() {
    if (failed_ || finished_) return false;
    finished_ = true;

    protocol::FrameSequence frames(streamId_, std::move(pending_), maxPayload_);
    pending_.clear();
    protocol::Frame frame;
    while (frames.Next(&frame)) {
        if (!SendFrame(frame)) return false;
    }
    return true;
}

} // namespace server
} // namespace streamux
