#pragma once

#include "lb/common/noncopyable.h"

#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace lb {
namespace network {

class EventLoop;

// Runs an EventLoop on its own thread. StartLoop blocks until the loop exists.
class EventLoopThread : lb::common::noncopyable {
public:
    explicit EventLoopThread(const std::string& name = std::string());
    ~EventLoopThread();

    EventLoop* StartLoop();

private:
    void ThreadFunc();

    EventLoop* loop_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
    std::string name_;
};

} // namespace network
} // namespace lb
