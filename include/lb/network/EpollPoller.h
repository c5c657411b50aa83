#pragma once

#include "lb/common/noncopyable.h"

#include <sys/epoll.h>

#include <chrono>
#include <vector>

namespace lb {
namespace network {

class Channel;

// Level-triggered epoll set for one EventLoop. A channel joins the set on
// its first non-empty interest mask and leaves it when the mask drops to
// zero or the channel is removed.
class EpollPoller : lb::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    EpollPoller();
    ~EpollPoller();

    // Blocks up to timeout_ms; returns the wake-up time.
    std::chrono::system_clock::time_point Poll(int timeout_ms, ChannelList* active_channels);
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);

private:
    bool Control(int operation, Channel* channel);

    int epollfd_;
    std::vector<struct epoll_event> events_;
};

} // namespace network
} // namespace lb
