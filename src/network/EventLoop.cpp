#include "lb/network/EventLoop.h"
#include "lb/common/Logger.h"
#include "lb/network/Channel.h"
#include "lb/network/EpollPoller.h"

#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace lb {
namespace network {

namespace {

thread_local EventLoop* t_loopInThisThread = nullptr;

// Upper bound on one poll; timers and wakeups end it sooner.
const int kPollTimeMs = 10000;
const long long kMinTimerNs = 1000000;

struct timespec ToTimespec(double seconds) {
    long long ns = static_cast<long long>(seconds * 1e9);
    if (ns < kMinTimerNs) ns = kMinTimerNs;
    struct timespec ts;
    ts.tv_sec = static_cast<time_t>(ns / 1000000000LL);
    ts.tv_nsec = static_cast<long>(ns % 1000000000LL);
    return ts;
}

} // namespace

struct EventLoop::Timer {
    int fd{-1};
    bool repeat{false};
    Functor callback;
    std::unique_ptr<Channel> channel;
};

EventLoop::EventLoop()
    : quit_(false),
      calling_pending_functors_(false),
      thread_id_(std::this_thread::get_id()),
      poller_(new EpollPoller()),
      wakeup_fd_(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)),
      next_timer_id_(1) {
    if (wakeup_fd_ < 0) {
        LOG_FATAL << "eventfd failed: " << std::strerror(errno);
    }
    if (t_loopInThisThread) {
        LOG_FATAL << "Another EventLoop " << t_loopInThisThread << " exists in thread " << thread_id_;
    } else {
        t_loopInThisThread = this;
    }

    wakeup_channel_.reset(new Channel(this, wakeup_fd_));
    wakeup_channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { DrainWakeup(); });
    wakeup_channel_->EnableReading();
}

EventLoop::~EventLoop() {
    while (!timers_.empty()) {
        RetireTimer(timers_.begin());
    }
    retired_timers_.clear();

    wakeup_channel_->Remove();
    ::close(wakeup_fd_);
    if (t_loopInThisThread == this) {
        t_loopInThisThread = nullptr;
    }
}

void EventLoop::Loop() {
    quit_ = false;
    LOG_DEBUG << "EventLoop " << this << " start looping";

    while (!quit_) {
        active_channels_.clear();
        const auto now = poller_->Poll(kPollTimeMs, &active_channels_);
        for (Channel* channel : active_channels_) {
            channel->HandleEvent(now);
        }
        retired_timers_.clear();
        DoPendingFunctors();
    }

    LOG_DEBUG << "EventLoop " << this << " stop looping";
}

void EventLoop::Quit() {
    quit_ = true;
    if (!IsInLoopThread()) {
        WakeUp();
    }
}

void EventLoop::RunInLoop(Functor cb) {
    if (IsInLoopThread()) {
        cb();
    } else {
        QueueInLoop(std::move(cb));
    }
}

void EventLoop::QueueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_functors_.emplace_back(std::move(cb));
    }

    if (!IsInLoopThread() || calling_pending_functors_) {
        WakeUp();
    }
}

void EventLoop::WakeUp() {
    uint64_t one = 1;
    if (::write(wakeup_fd_, &one, sizeof one) != sizeof one) {
        LOG_ERROR << "EventLoop wakeup write failed: " << std::strerror(errno);
    }
}

void EventLoop::DrainWakeup() {
    uint64_t count = 0;
    if (::read(wakeup_fd_, &count, sizeof count) != sizeof count && errno != EAGAIN) {
        LOG_ERROR << "EventLoop wakeup read failed: " << std::strerror(errno);
    }
}

void EventLoop::UpdateChannel(Channel* channel) {
    poller_->UpdateChannel(channel);
}

void EventLoop::RemoveChannel(Channel* channel) {
    poller_->RemoveChannel(channel);
}

void EventLoop::DoPendingFunctors() {
    std::vector<Functor> functors;
    calling_pending_functors_ = true;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        functors.swap(pending_functors_);
    }

    for (const auto& functor : functors) {
        functor();
    }
    calling_pending_functors_ = false;
}

EventLoop::TimerId EventLoop::RunAfter(double delaySec, Functor cb) {
    return AddTimer(delaySec, false, std::move(cb));
}

EventLoop::TimerId EventLoop::RunEvery(double intervalSec, Functor cb) {
    return AddTimer(intervalSec, true, std::move(cb));
}

EventLoop::TimerId EventLoop::AddTimer(double delaySec, bool repeat, Functor cb) {
    const int fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        LOG_ERROR << "timerfd_create failed: " << std::strerror(errno);
        return 0;
    }

    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    howlong.it_value = ToTimespec(delaySec);
    if (repeat) howlong.it_interval = howlong.it_value;
    if (::timerfd_settime(fd, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "timerfd_settime failed: " << std::strerror(errno);
        ::close(fd);
        return 0;
    }

    const TimerId id = next_timer_id_++;
    std::unique_ptr<Timer> timer(new Timer);
    timer->fd = fd;
    timer->repeat = repeat;
    timer->callback = std::move(cb);
    timer->channel.reset(new Channel(this, fd));
    timer->channel->SetReadCallback([this, id](std::chrono::system_clock::time_point) { FireTimer(id); });
    timer->channel->EnableReading();
    timers_[id] = std::move(timer);
    return id;
}

void EventLoop::FireTimer(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) return;

    uint64_t expirations = 0;
    if (::read(it->second->fd, &expirations, sizeof expirations) != sizeof expirations) {
        return;
    }

    if (it->second->repeat) {
        // Copy: the callback may cancel its own timer.
        Functor cb = it->second->callback;
        cb();
    } else {
        Functor cb = std::move(it->second->callback);
        RetireTimer(it);
        cb();
    }
}

void EventLoop::Cancel(TimerId id) {
    auto it = timers_.find(id);
    if (it != timers_.end()) {
        RetireTimer(it);
    }
}

void EventLoop::RetireTimer(std::map<TimerId, std::unique_ptr<Timer>>::iterator it) {
    std::unique_ptr<Timer> timer = std::move(it->second);
    timers_.erase(it);
    timer->channel->Remove();
    ::close(timer->fd);
    timer->fd = -1;
    timer->callback = nullptr;
    retired_timers_.push_back(std::move(timer));
}

} // namespace network
} // namespace lb
