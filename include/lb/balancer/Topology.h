#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace lb {
namespace balancer {

// Position of a backend in the configured list. Stable for the process lifetime.
using BackendId = size_t;

struct Backend {
    std::string address;          // "host:port"
    std::string healthCheckPath;  // e.g. "/health"
};

struct PathRoute {
    std::string pathPrefix;
    std::string address;          // "host:port"
};

// The fixed backend set and path-route table. Immutable after construction,
// so it is shared across threads without locking.
class Topology {
public:
    Topology() = default;
    Topology(std::vector<Backend> backends, std::vector<PathRoute> routes);

    const std::vector<Backend>& backends() const { return backends_; }
    const std::vector<PathRoute>& routes() const { return routes_; }

    size_t BackendCount() const { return backends_.size(); }
    const Backend& backend(BackendId id) const { return backends_[id]; }

    // True when some route targets this backend's address; such backends are
    // never picked by round robin.
    bool IsPathRouted(BackendId id) const { return pathRouted_[id]; }

    // First route, in configuration order, whose prefix starts `path`.
    const PathRoute* MatchRoute(const std::string& path) const;

private:
    std::vector<Backend> backends_;
    std::vector<PathRoute> routes_;
    std::vector<bool> pathRouted_;
};

} // namespace balancer
} // namespace lb
