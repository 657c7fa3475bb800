#include "streamux/network/Channel.h"
#include "streamux/network/EventLoop.h"
#include "streamux/common/Logger.h"

#include <sys/epoll.h>

namespace streamux {
namespace network {

const int Channel::kNoneEvent = 0;
const int Channel::kReadEvent = EPOLLIN | EPOLLPRI;
const int Channel::kWriteEvent = EPOLLOUT;

Channel::Channel(EventLoop* loop, int fd)
    : loop_(loop),
      fd_(fd),
      events_(0),
      revents_(0),
      index_(-1),
      tied_(false) {
}

Channel::~Channel() = default;

void Channel::Tie(const std::shared_ptr<void>& owner) {
    tie_ = owner;
    tied_ = true;
}

void Channel::Update() {
    loop_->UpdateChannel(this);
}

void Channel::Remove() {
    loop_->RemoveChannel(this);
}

void Channel::HandleEvent(std::chrono::system_clock::time_point receiveTime) {
    if (tied_) {
        std::shared_ptr<void> guard = tie_.lock();
        if (guard) {
            HandleEventWithGuard(receiveTime);
        }
        return;
    }
    HandleEventWithGuard(receiveTime);
}

void Channel::HandleEventWithGuard(std::chrono::system_clock::time_point receiveTime) {
    if ((revents_ & EPOLLHUP) && !(revents_ & EPOLLIN)) {
        LOG_DEBUG << "Channel fd=" << fd_ << " EPOLLHUP";
        if (closeCallback_) closeCallback_();
        return;
    }

    if (revents_ & EPOLLERR) {
        if (errorCallback_) errorCallback_();
    }

    if (revents_ & (EPOLLIN | EPOLLPRI | EPOLLRDHUP)) {
        if (readCallback_) readCallback_(receiveTime);
    }

    if (revents_ & EPOLLOUT) {
        if (writeCallback_) writeCallback_();
    }
}

} // namespace network
} // namespace streamux
