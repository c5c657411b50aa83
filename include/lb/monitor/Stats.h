#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace lb {
namespace monitor {

// Process-wide counters. Increments are relaxed atomics; ToJson is a
// best-effort view, not a consistent cut.
class Stats {
public:
    static Stats& Instance();

    void IncAcceptedConnections() { acceptedConnections_.fetch_add(1, std::memory_order_relaxed); }
    long GetAcceptedConnections() const { return acceptedConnections_.load(std::memory_order_relaxed); }

    void IncActiveConnections() { activeConnections_.fetch_add(1, std::memory_order_relaxed); }
    void DecActiveConnections() { activeConnections_.fetch_sub(1, std::memory_order_relaxed); }
    long GetActiveConnections() const { return activeConnections_.load(std::memory_order_relaxed); }

    void IncPathRouted() { pathRouted_.fetch_add(1, std::memory_order_relaxed); }
    long GetPathRouted() const { return pathRouted_.load(std::memory_order_relaxed); }

    void IncRoundRobinRouted() { roundRobinRouted_.fetch_add(1, std::memory_order_relaxed); }
    long GetRoundRobinRouted() const { return roundRobinRouted_.load(std::memory_order_relaxed); }

    void IncUnavailable() { unavailable_.fetch_add(1, std::memory_order_relaxed); }
    long GetUnavailable() const { return unavailable_.load(std::memory_order_relaxed); }

    void IncBackendConnectFailures() { backendConnectFailures_.fetch_add(1, std::memory_order_relaxed); }
    long GetBackendConnectFailures() const { return backendConnectFailures_.load(std::memory_order_relaxed); }

    // client -> backend
    void AddBytesUpstream(long long n) { bytesUpstream_.fetch_add(n, std::memory_order_relaxed); }
    long long GetBytesUpstream() const { return bytesUpstream_.load(std::memory_order_relaxed); }
    // backend -> client
    void AddBytesDownstream(long long n) { bytesDownstream_.fetch_add(n, std::memory_order_relaxed); }
    long long GetBytesDownstream() const { return bytesDownstream_.load(std::memory_order_relaxed); }

    struct BackendSnapshot {
        std::string address;
        bool healthy{true};
        bool pathRouted{false};
    };
    // Published by the health monitor after every commit.
    void SetBackendSnapshot(std::vector<BackendSnapshot> backends);
    std::vector<BackendSnapshot> GetBackendSnapshot() const;

    std::string ToJson() const;

private:
    Stats();

    std::atomic<long> acceptedConnections_{0};
    std::atomic<long> activeConnections_{0};
    std::atomic<long> pathRouted_{0};
    std::atomic<long> roundRobinRouted_{0};
    std::atomic<long> unavailable_{0};
    std::atomic<long> backendConnectFailures_{0};
    std::atomic<long long> bytesUpstream_{0};
    std::atomic<long long> bytesDownstream_{0};

    std::chrono::system_clock::time_point startTime_;

    mutable std::mutex mutex_;
    std::vector<BackendSnapshot> backends_;
};

} // namespace monitor
} // namespace lb
