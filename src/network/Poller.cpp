#include "streamux/network/Poller.h"
#include "streamux/network/Channel.h"
#include "streamux/network/EpollPoller.h"

namespace streamux {
namespace network {

Poller::Poller(EventLoop* loop) : ownerLoop_(loop) {}

Poller::~Poller() = default;

bool Poller::HasChannel(Channel* channel) const {
    auto it = channels_.find(channel->fd());
    return it != channels_.end() && it->second == channel;
}

Poller* Poller::NewDefaultPoller(EventLoop* loop) {
    return new EpollPoller(loop);
}

} // namespace network
} // namespace streamux
