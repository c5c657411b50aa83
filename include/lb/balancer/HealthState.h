#pragma once

#include "lb/balancer/Topology.h"
#include "lb/common/noncopyable.h"

#include <mutex>
#include <vector>

namespace lb {
namespace balancer {

// Health flag per backend, all healthy at construction. Written only by the
// health monitor, one whole tick at a time.
class HealthState : lb::common::noncopyable {
public:
    explicit HealthState(size_t backendCount)
        : healthy_(backendCount, true) {}

    size_t size() const { return size_; }

    bool IsHealthy(BackendId id) const;
    std::vector<bool> Snapshot() const;

    // Replaces every flag in one critical section. Returns the previous flags.
    // A vector of the wrong size is rejected and leaves the state untouched.
    bool Commit(const std::vector<bool>& results, std::vector<bool>* previous = nullptr);

    size_t HealthyCount() const;

private:
    mutable std::mutex mutex_;
    std::vector<bool> healthy_;
    const size_t size_ = healthy_.size();
};

} // namespace balancer
} // namespace lb
