#include "lb/network/EpollPoller.h"
#include "lb/network/Channel.h"
#include "lb/common/Logger.h"

#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace lb {
namespace network {

namespace {

const size_t kInitialEvents = 64;

} // namespace

EpollPoller::EpollPoller()
    : epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      events_(kInitialEvents) {
    if (epollfd_ < 0) {
        LOG_FATAL << "epoll_create1 failed: " << std::strerror(errno);
    }
}

EpollPoller::~EpollPoller() {
    if (epollfd_ >= 0) ::close(epollfd_);
}

std::chrono::system_clock::time_point EpollPoller::Poll(int timeout_ms, ChannelList* active_channels) {
    const int n = ::epoll_wait(epollfd_, events_.data(), static_cast<int>(events_.size()), timeout_ms);
    const int savedErrno = errno;
    const auto now = std::chrono::system_clock::now();

    if (n < 0) {
        if (savedErrno != EINTR) LOG_ERROR << "epoll_wait: " << std::strerror(savedErrno);
        return now;
    }

    for (int i = 0; i < n; ++i) {
        Channel* channel = static_cast<Channel*>(events_[i].data.ptr);
        channel->set_revents(static_cast<int>(events_[i].events));
        active_channels->push_back(channel);
    }
    // A full batch means more may be waiting; take a bigger bite next time.
    if (static_cast<size_t>(n) == events_.size()) {
        events_.resize(events_.size() * 2);
    }
    return now;
}

void EpollPoller::UpdateChannel(Channel* channel) {
    const bool wanted = channel->events() != 0;
    if (!channel->registered()) {
        if (wanted && Control(EPOLL_CTL_ADD, channel)) {
            channel->set_registered(true);
        }
        return;
    }

    if (wanted) {
        Control(EPOLL_CTL_MOD, channel);
    } else {
        Control(EPOLL_CTL_DEL, channel);
        channel->set_registered(false);
    }
}

void EpollPoller::RemoveChannel(Channel* channel) {
    if (channel->registered()) {
        Control(EPOLL_CTL_DEL, channel);
        channel->set_registered(false);
    }
}

bool EpollPoller::Control(int operation, Channel* channel) {
    struct epoll_event event;
    std::memset(&event, 0, sizeof event);
    event.events = static_cast<uint32_t>(channel->events());
    event.data.ptr = channel;
    if (::epoll_ctl(epollfd_, operation, channel->fd(), &event) < 0) {
        LOG_ERROR << "epoll_ctl op=" << operation << " fd=" << channel->fd() << ": " << std::strerror(errno);
        return false;
    }
    return true;
}

} // namespace network
} // namespace lb
