#pragma once

#include "streamux/common/noncopyable.h"

#include <functional>
#include <mutex>
#include <string>

namespace streamux {
namespace server {

// Per-connection state shared between the I/O loop and the workers serving
// that connection's requests.
//
// All output goes through Write(), which holds the connection's single write
// lock for one unit: one frame or one whole response. Units therefore never
// interleave, while units of different streams may alternate freely.
class StreamSession : streamux::common::noncopyable {
public:
    enum State {
        kOpen,
        kClosing,
        kClosed,
    };

    // Delivers one unit to the transport; false when the transport is gone.
    using Sink = std::function<bool(const std::string&)>;

    StreamSession(const std::string& name, Sink sink);

    bool Write(const std::string& unit);

    // A worker task was created for this connection.
    void BeginRequest();
    // Returns true when this was the last outstanding task of a closing
    // session, i.e. the caller must close the transport.
    bool EndRequest();

    // Peer finished sending. Returns true when nothing is outstanding and the
    // transport can be closed right away.
    bool MarkClosing();
    void MarkClosed();

    State state() const;
    int inflight() const;
    const std::string& name() const { return name_; }

    static const char* StateToString(State s);

private:
    const std::string name_;
    Sink sink_;

    std::mutex writeMutex_;

    mutable std::mutex stateMutex_;
    State state_;
    int inflight_;
};

} // namespace server
} // namespace streamux
