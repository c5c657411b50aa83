#include "lb/monitor/Stats.h"

#include <sstream>

namespace lb {
namespace monitor {

namespace {

std::string JsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out += c; break;
        }
    }
    return out;
}

} // namespace

Stats& Stats::Instance() {
    static Stats instance;
    return instance;
}

Stats::Stats() : startTime_(std::chrono::system_clock::now()) {}

void Stats::SetBackendSnapshot(std::vector<BackendSnapshot> backends) {
    std::lock_guard<std::mutex> lock(mutex_);
    backends_ = std::move(backends);
}

std::vector<Stats::BackendSnapshot> Stats::GetBackendSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backends_;
}

std::string Stats::ToJson() const {
    auto now = std::chrono::system_clock::now();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - startTime_).count();

    std::stringstream ss;
    ss << "{\n";
    ss << "  \"uptime_sec\": " << uptime << ",\n";
    ss << "  \"accepted_connections\": " << acceptedConnections_.load() << ",\n";
    ss << "  \"active_connections\": " << activeConnections_.load() << ",\n";
    ss << "  \"path_routed\": " << pathRouted_.load() << ",\n";
    ss << "  \"round_robin_routed\": " << roundRobinRouted_.load() << ",\n";
    ss << "  \"unavailable\": " << unavailable_.load() << ",\n";
    ss << "  \"backend_connect_failures\": " << backendConnectFailures_.load() << ",\n";
    ss << "  \"bytes_upstream\": " << bytesUpstream_.load() << ",\n";
    ss << "  \"bytes_downstream\": " << bytesDownstream_.load() << ",\n";

    ss << "  \"backends\": [";
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < backends_.size(); ++i) {
            const auto& b = backends_[i];
            ss << (i == 0 ? "\n" : ",\n");
            ss << "    {\"address\": \"" << JsonEscape(b.address) << "\", "
               << "\"healthy\": " << (b.healthy ? "true" : "false") << ", "
               << "\"path_routed\": " << (b.pathRouted ? "true" : "false") << "}";
        }
        if (!backends_.empty()) ss << "\n  ";
    }
    ss << "]\n";
    ss << "}";
    return ss.str();
}

} // namespace monitor
} // namespace lb
