#pragma once

#include "lb/balancer/Topology.h"
#include "lb/network/EventLoop.h"

#include <functional>
#include <memory>

namespace lb {
namespace balancer {

class HealthChecker {
public:
    using CheckCallback = std::function<void(bool healthy)>;

    explicit HealthChecker(lb::network::EventLoop* loop) : loop_(loop) {}
    virtual ~HealthChecker() = default;

    // Async health check of one backend. The callback runs exactly once, on the loop thread.
    virtual void Check(const Backend& backend, CheckCallback cb) = 0;

    lb::network::EventLoop* loop() const { return loop_; }

protected:
    lb::network::EventLoop* loop_;
};

using HealthCheckerPtr = std::shared_ptr<HealthChecker>;

} // namespace balancer
} // namespace lb
