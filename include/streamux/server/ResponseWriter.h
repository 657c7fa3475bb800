#pragma once

#include "streamux/protocol/HttpResponse.h"
#include "streamux/protocol/StreamFramer.h"

#include <cstdint>
#include <memory>
#include <string>

namespace streamux {
namespace server {

class StreamSession;

// Where a request handler puts its response bytes. Write() may be called any
// number of times, then Finish() exactly once. Both return false once the
// connection is gone; the handler should stop producing output then.
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    virtual bool Write(const std::string& data) = 0;
    virtual bool Finish() = 0;

    bool WriteResponse(const protocol::HttpResponse& resp) {
        return Write(resp.toString()) && Finish();
    }
};

// Non-multiplexed: the whole response goes out in one locked write.
class PlainResponseWriter : public ResponseWriter {
public:
    explicit PlainResponseWriter(std::shared_ptr<StreamSession> session);

    bool Write(const std::string& data) override;
    bool Finish() override;

private:
    std::shared_ptr<StreamSession> session_;
    std::string pending_;
    bool finished_{false};
};

// Multiplexed: bytes are cut into frames as they arrive, one locked write per
// frame. The last chunk is held back until Finish() so that the end flag
// lands on the final frame.
class FramedResponseWriter : public ResponseWriter {
public:
    FramedResponseWriter(std::shared_ptr<StreamSession> session,
                         uint64_t streamId,
                         protocol::FrameCodec::Format format,
                         size_t maxPayload = protocol::kMaxFramePayload);

    bool Write(const std::string& data) override;
    bool Finish() override;

    size_t framesSent() const { return framesSent_; }

private:
    bool SendFrame(const protocol::Frame& frame);

    std::shared_ptr<StreamSession> session_;
    const uint64_t streamId_;
    const protocol::FrameCodec::Format format_;
    const size_t maxPayload_;
    std::string pending_;
    size_t framesSent_{0};
    bool failed_{false};
    bool finished_{false};
};

} // namespace server
} // namespace streamux
