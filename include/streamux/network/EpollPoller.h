#pragma once

#include "streamux/network/Poller.h"

#include <sys/epoll.h>
#include <vector>

namespace streamux {
namespace network {

class EpollPoller : public Poller {
public:
    explicit EpollPoller(EventLoop* loop);
    ~EpollPoller() override;

    std::chrono::system_clock::time_point Poll(int timeoutMs, ChannelList* activeChannels) override;
    void UpdateChannel(Channel* channel) override;
    void RemoveChannel(Channel* channel) override;

private:
    static const int kInitEventListSize = 16;

    void FillActiveChannels(int numEvents, ChannelList* activeChannels) const;
    void Update(int operation, Channel* channel);

    int epollfd_;
    std::vector<struct epoll_event> events_;
};

} // namespace network
} // namespace streamux
