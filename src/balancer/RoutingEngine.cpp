#include "lb/balancer/RoutingEngine.h"

#include <vector>

namespace lb {
namespace balancer {

const char* RouteKindName(RouteDecision::Kind kind) {
    switch (kind) {
        case RouteDecision::kPathRouted: return "path";
        case RouteDecision::kRoundRobin: return "round-robin";
        case RouteDecision::kUnavailable: return "unavailable";
    }
    return "unknown";
}

RoutingEngine::RoutingEngine(std::shared_ptr<const Topology> topology,
                             std::shared_ptr<const HealthState> health)
    : topology_(std::move(topology)),
      health_(std::move(health)),
      cursor_(0) {
}

RouteDecision RoutingEngine::Route(const std::string& path) {
    if (const PathRoute* route = topology_->MatchRoute(path)) {
        RouteDecision d;
        d.kind = RouteDecision::kPathRouted;
        d.address = route->address;
        return d;
    }
    return PickRoundRobin();
}

RouteDecision RoutingEngine::PickRoundRobin() {
    std::lock_guard<std::mutex> lock(cursorMutex_);

    const std::vector<bool> healthy = health_->Snapshot();
    std::vector<BackendId> candidates;
    candidates.reserve(topology_->BackendCount());
    for (BackendId id = 0; id < topology_->BackendCount(); ++id) {
        if (id < healthy.size() && healthy[id] && !topology_->IsPathRouted(id)) {
            candidates.push_back(id);
        }
    }

    RouteDecision d;
    if (candidates.empty()) return d;

    const BackendId chosen = candidates[cursor_ % candidates.size()];
    ++cursor_;

    d.kind = RouteDecision::kRoundRobin;
    d.backendId = chosen;
    d.address = topology_->backend(chosen).address;
    return d;
}

uint64_t RoutingEngine::cursor() const {
    std::lock_guard<std::mutex> lock(cursorMutex_);
    return cursor_;
}

} // namespace balancer
} // namespace lb
