#pragma once

#include "lb/balancer/HealthState.h"
#include "lb/balancer/Topology.h"
#include "lb/common/noncopyable.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace lb {
namespace balancer {

struct RouteDecision {
    enum Kind { kPathRouted, kRoundRobin, kUnavailable };

    Kind kind = kUnavailable;
    std::string address;       // empty when unavailable
    BackendId backendId = 0;   // meaningful for kRoundRobin only

    bool available() const { return kind != kUnavailable; }
};

const char* RouteKindName(RouteDecision::Kind kind);

// Maps a request path to a backend address: path routes first, then round
// robin over healthy backends that no path route targets.
class RoutingEngine : lb::common::noncopyable {
public:
    RoutingEngine(std::shared_ptr<const Topology> topology,
                  std::shared_ptr<const HealthState> health);

    // Thread safe.
    RouteDecision Route(const std::string& path);

    uint64_t cursor() const;

private:
    RouteDecision PickRoundRobin();

    std::shared_ptr<const Topology> topology_;
    std::shared_ptr<const HealthState> health_;

    // Held across snapshot, candidate build, pick and increment. Taken
    // before the health mutex, never after it.
    mutable std::mutex cursorMutex_;
    uint64_t cursor_;
};

} // namespace balancer
} // namespace lb
