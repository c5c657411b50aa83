#pragma once

#include "lb/common/noncopyable.h"

#include <chrono>
#include <functional>
#include <memory>

namespace lb {
namespace network {

class EventLoop;

// Binds one fd to its owner's callbacks inside a single EventLoop. The
// channel never owns the fd; whoever created it closes it after Remove().
class Channel : lb::common::noncopyable {
public:
    using EventCallback = std::function<void()>;
    using ReadEventCallback = std::function<void(std::chrono::system_clock::time_point)>;

    Channel(EventLoop* loop, int fd);

    void HandleEvent(std::chrono::system_clock::time_point receive_time);

    void SetReadCallback(ReadEventCallback cb) { read_callback_ = std::move(cb); }
    void SetWriteCallback(EventCallback cb) { write_callback_ = std::move(cb); }
    void SetCloseCallback(EventCallback cb) { close_callback_ = std::move(cb); }
    void SetErrorCallback(EventCallback cb) { error_callback_ = std::move(cb); }

    // Events are dropped once owner has expired.
    void Tie(const std::shared_ptr<void>& owner);

    int fd() const { return fd_; }
    int events() const { return events_; }
    void set_revents(int revt) { revents_ = revt; }

    void EnableReading() { events_ |= kReadEvent; Update(); }
    void DisableReading() { events_ &= ~kReadEvent; Update(); }
    void EnableWriting() { events_ |= kWriteEvent; Update(); }
    void DisableWriting() { events_ &= ~kWriteEvent; Update(); }
    void DisableAll() { events_ = 0; Update(); }
    bool IsWriting() const { return (events_ & kWriteEvent) != 0; }

    // Poller bookkeeping: whether the fd is currently in the epoll set.
    bool registered() const { return registered_; }
    void set_registered(bool on) { registered_ = on; }

    void Remove();

private:
    void Update();
    void Dispatch(std::chrono::system_clock::time_point receive_time);

    static const int kReadEvent;
    static const int kWriteEvent;

    EventLoop* loop_;
    const int fd_;
    int events_;
    int revents_;
    bool registered_;

    std::weak_ptr<void> tie_;
    bool tied_;

    ReadEventCallback read_callback_;
    EventCallback write_callback_;
    EventCallback close_callback_;
    EventCallback error_callback_;
};

} // namespace network
} // namespace lb
