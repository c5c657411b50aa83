#include "lb/balancer/HealthState.h"

#include <algorithm>

namespace lb {
namespace balancer {

bool HealthState::IsHealthy(BackendId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return id < healthy_.size() && healthy_[id];
}

std::vector<bool> HealthState::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return healthy_;
}

bool HealthState::Commit(const std::vector<bool>& results, std::vector<bool>* previous) {
    if (results.size() != size_) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    if (previous) *previous = healthy_;
    healthy_ = results;
    return true;
}

size_t HealthState::HealthyCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count(healthy_.begin(), healthy_.end(), true));
}

} // namespace balancer
} // namespace lb
