#include "streamux/network/EpollPoller.h"
#include "streamux/network/Channel.h"
#include "streamux/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace streamux {
namespace network {

namespace {
// Channel::index() values as seen by this poller.
const int kNew = -1;
const int kAdded = 1;
const int kDeleted = 2;
} // namespace

EpollPoller::EpollPoller(EventLoop* loop)
    : Poller(loop),
      epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      events_(kInitEventListSize) {
    if (epollfd_ < 0) {
        LOG_FATAL << "EpollPoller epoll_create1 failed errno=" << errno;
    }
}

EpollPoller::~EpollPoller() {
    ::close(epollfd_);
}

std::chrono::system_clock::time_point EpollPoller::Poll(int timeoutMs, ChannelList* activeChannels) {
    int numEvents = ::epoll_wait(epollfd_, events_.data(), static_cast<int>(events_.size()), timeoutMs);
    int savedErrno = errno;
    auto now = std::chrono::system_clock::now();

    if (numEvents > 0) {
        FillActiveChannels(numEvents, activeChannels);
        if (static_cast<size_t>(numEvents) == events_.size()) {
            events_.resize(events_.size() * 2);
        }
    } else if (numEvents < 0 && savedErrno != EINTR) {
        LOG_ERROR << "EpollPoller::Poll errno=" << savedErrno;
    }
    return now;
}

void EpollPoller::FillActiveChannels(int numEvents, ChannelList* activeChannels) const {
    for (int i = 0; i < numEvents; ++i) {
        Channel* channel = static_cast<Channel*>(events_[i].data.ptr);
        channel->set_revents(static_cast<int>(events_[i].events));
        activeChannels->push_back(channel);
    }
}

void EpollPoller::UpdateChannel(Channel* channel) {
    const int index = channel->index();
    if (index == kNew || index == kDeleted) {
        if (index == kNew) {
            channels_[channel->fd()] = channel;
        }
        channel->set_index(kAdded);
        Update(EPOLL_CTL_ADD, channel);
        return;
    }

    if (channel->IsNoneEvent()) {
        Update(EPOLL_CTL_DEL, channel);
        channel->set_index(kDeleted);
    } else {
        Update(EPOLL_CTL_MOD, channel);
    }
}

void EpollPoller::RemoveChannel(Channel* channel) {
    channels_.erase(channel->fd());
    if (channel->index() == kAdded) {
        Update(EPOLL_CTL_DEL, channel);
    }
    channel->set_index(kNew);
}

void EpollPoller::Update(int operation, Channel* channel) {
    struct epoll_event event;
    std::memset(&event, 0, sizeof(event));
    event.events = static_cast<uint32_t>(channel->events());
    event.data.ptr = channel;
    const int fd = channel->fd();
    if (::epoll_ctl(epollfd_, operation, fd, &event) < 0) {
        if (operation == EPOLL_CTL_DEL) {
            LOG_ERROR << "epoll_ctl DEL fd=" << fd << " errno=" << errno;
        } else {
            LOG_FATAL << "epoll_ctl op=" << operation << " fd=" << fd << " errno=" << errno;
        }
    }
}

} // namespace network
} // namespace streamux
