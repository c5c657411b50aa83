#include "lb/balancer/Topology.h"

#include <unordered_set>

namespace lb {
namespace balancer {

Topology::Topology(std::vector<Backend> backends, std::vector<PathRoute> routes)
    : backends_(std::move(backends)),
      routes_(std::move(routes)),
      pathRouted_(backends_.size(), false) {
    std::unordered_set<std::string> routed;
    for (const auto& r : routes_) routed.insert(r.address);
    for (size_t i = 0; i < backends_.size(); ++i) {
        pathRouted_[i] = routed.count(backends_[i].address) != 0;
    }
}

const PathRoute* Topology::MatchRoute(const std::string& path) const {
    for (const auto& r : routes_) {
        if (path.compare(0, r.pathPrefix.size(), r.pathPrefix) == 0) {
            return &r;
        }
    }
    return nullptr;
}

} // namespace balancer
} // namespace lb
