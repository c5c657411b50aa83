#pragma once

#include "lb/balancer/HealthChecker.h"
#include "lb/balancer/HealthState.h"
#include "lb/balancer/Topology.h"
#include "lb/common/noncopyable.h"
#include "lb/network/EventLoop.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace lb {
namespace balancer {

// Checks every backend once per interval and commits the whole round to
// HealthState at once. Runs on a single event loop; create with make_shared.
class HealthMonitor : lb::common::noncopyable,
                      public std::enable_shared_from_this<HealthMonitor> {
public:
    using TickCallback = std::function<void(const std::vector<bool>& results)>;

    HealthMonitor(lb::network::EventLoop* loop,
                  std::shared_ptr<const Topology> topology,
                  std::shared_ptr<HealthState> health,
                  HealthCheckerPtr checker,
                  double intervalSec = 5.0);
    ~HealthMonitor();

    // Arms the periodic timer and launches the first tick right away.
    // Call from the loop thread. False if the timer cannot be armed.
    bool Start();
    void Stop();

    // Launches one tick now unless one is already in flight. Loop thread only.
    void RunTick();

    // Called on the loop thread after every commit.
    void SetTickCallback(TickCallback cb) { tickCallback_ = std::move(cb); }

    uint64_t CompletedTicks() const { return completedTicks_.load(std::memory_order_acquire); }
    uint64_t SkippedTicks() const { return skippedTicks_.load(std::memory_order_relaxed); }
    bool TickInFlight() const { return tickInFlight_; }

private:
    struct Tick {
        std::vector<bool> results;
        size_t pending{0};
    };

    void OnCheckResult(const std::shared_ptr<Tick>& tick, BackendId id, bool healthy);
    void CommitTick(const std::shared_ptr<Tick>& tick);

    lb::network::EventLoop* loop_;
    std::shared_ptr<const Topology> topology_;
    std::shared_ptr<HealthState> health_;
    HealthCheckerPtr checker_;
    double intervalSec_;

    lb::network::EventLoop::TimerId timer_;

    bool tickInFlight_;
    std::atomic<uint64_t> completedTicks_;
    std::atomic<uint64_t> skippedTicks_;
    TickCallback tickCallback_;
};

} // namespace balancer
} // namespace lb
