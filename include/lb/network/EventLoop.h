#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "lb/common/noncopyable.h"

namespace lb {
namespace network {

class Channel;
class EpollPoller;

// One reactor per thread. Every Channel belongs to exactly one loop and is
// only touched from that loop's thread; other threads hand work over with
// RunInLoop/QueueInLoop.
class EventLoop : lb::common::noncopyable {
public:
    using Functor = std::function<void()>;
    // 0 never names a live timer.
    using TimerId = uint64_t;

    EventLoop();
    ~EventLoop();

    void Loop();
    void Quit();

    void RunInLoop(Functor cb);
    void QueueInLoop(Functor cb);

    // Timers run their callback on this loop. Create and cancel them from
    // the loop thread. Delays under a millisecond are rounded up to one.
    TimerId RunAfter(double delaySec, Functor cb);
    TimerId RunEvery(double intervalSec, Functor cb);
    // No-op for an expired or unknown id; safe from inside the timer's own
    // callback.
    void Cancel(TimerId id);

    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);

    bool IsInLoopThread() const { return thread_id_ == std::this_thread::get_id(); }

private:
    struct Timer;

    void WakeUp();
    void DrainWakeup();
    void DoPendingFunctors();
    TimerId AddTimer(double delaySec, bool repeat, Functor cb);
    void FireTimer(TimerId id);
    void RetireTimer(std::map<TimerId, std::unique_ptr<Timer>>::iterator it);

    std::atomic_bool quit_;
    std::atomic_bool calling_pending_functors_;

    const std::thread::id thread_id_;
    std::unique_ptr<EpollPoller> poller_;

    int wakeup_fd_;
    std::unique_ptr<Channel> wakeup_channel_;

    std::vector<Channel*> active_channels_;

    std::map<TimerId, std::unique_ptr<Timer>> timers_;
    // Cancelled timers whose channel may still be in active_channels_.
    std::vector<std::unique_ptr<Timer>> retired_timers_;
    TimerId next_timer_id_;

    std::mutex mutex_;
    std::vector<Functor> pending_functors_;
};

} // namespace network
} // namespace lb
