#include "streamux/server/StreamSession.h"
#include "streamux/common/Logger.h"

namespace streamux {
namespace server {

StreamSession::StreamSession(const std::string& name, Sink sink)
    : name_(name),
      sink_(std::move(sink)),
      state_(kOpen),
      inflight_(0) {
}

const char* StreamSession::StateToString(State s) {
    switch (s) {
        case kOpen: return "OPEN";
        case kClosing: return "CLOSING";
        case kClosed: return "CLOSED";
    }
    return "unknown";
}

bool StreamSession::Write(const std::string& unit) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    if (state() == kClosed) return false;
    return sink_(unit);
}

void StreamSession::BeginRequest() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    ++inflight_;
}

bool StreamSession::EndRequest() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    --inflight_;
    return inflight_ == 0 && state_ == kClosing;
}

bool StreamSession::MarkClosing() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (state_ != kOpen) return false;
    state_ = kClosing;
    LOG_DEBUG << "StreamSession[" << name_ << "] CLOSING with " << inflight_ << " in flight";
    return inflight_ == 0;
}

void StreamSession::MarkClosed() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    state_ = kClosed;
}

StreamSession::State StreamSession::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

int StreamSession::inflight() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return inflight_;
}

} // namespace server
} // namespace streamux
