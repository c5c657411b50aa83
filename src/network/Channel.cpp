#include "lb/network/Channel.h"
#include "lb/network/EventLoop.h"

#include <sys/epoll.h>

namespace lb {
namespace network {

// EPOLLRDHUP reports a peer half-close as readable so the owner's read
// path sees the 0-byte read.
const int Channel::kReadEvent = EPOLLIN | EPOLLPRI | EPOLLRDHUP;
const int Channel::kWriteEvent = EPOLLOUT;

Channel::Channel(EventLoop* loop, int fd)
    : loop_(loop),
      fd_(fd),
      events_(0),
      revents_(0),
      registered_(false),
      tied_(false) {
}

void Channel::Tie(const std::shared_ptr<void>& owner) {
    tie_ = owner;
    tied_ = true;
}

void Channel::Update() {
    loop_->UpdateChannel(this);
}

void Channel::Remove() {
    events_ = 0;
    loop_->RemoveChannel(this);
}

void Channel::HandleEvent(std::chrono::system_clock::time_point receive_time) {
    if (!tied_) {
        Dispatch(receive_time);
        return;
    }
    if (std::shared_ptr<void> guard = tie_.lock()) {
        Dispatch(receive_time);
    }
}

void Channel::Dispatch(std::chrono::system_clock::time_point receive_time) {
    const int ev = revents_;
    revents_ = 0;

    // A hang-up with nothing left to read goes straight to close when the
    // owner handles it; connecting sockets only listen for error and write.
    if ((ev & EPOLLHUP) && !(ev & EPOLLIN) && close_callback_) {
        close_callback_();
        return;
    }
    if ((ev & EPOLLERR) && error_callback_) {
        error_callback_();
    }
    if ((ev & kReadEvent) && read_callback_) {
        read_callback_(receive_time);
    }
    if ((ev & kWriteEvent) && write_callback_) {
        write_callback_();
    }
}

} // namespace network
} // namespace lb
