#include "lb/balancer/HealthChecker.h"
#include "lb/balancer/HealthMonitor.h"
#include "lb/balancer/HealthState.h"
#include "lb/balancer/Topology.h"
#include "lb/common/Logger.h"
#include "lb/monitor/Stats.h"
#include "lb/network/EventLoop.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace lb;
using namespace lb::balancer;

namespace {

// Holds check callbacks until the test answers them, or answers on the next
// loop iteration once `autoAnswer` is set.
class ScriptedChecker : public HealthChecker {
public:
    explicit ScriptedChecker(network::EventLoop* loop) : HealthChecker(loop) {}

    void Check(const Backend& backend, CheckCallback cb) override {
        checks++;
        if (autoAnswer) {
            const bool healthy = answers[backend.address];
            loop_->QueueInLoop([cb, healthy]() { cb(healthy); });
            return;
        }
        held[backend.address] = std::move(cb);
    }

    void Answer(const std::string& address, bool healthy) {
        auto it = held.find(address);
        assert(it != held.end());
        CheckCallback cb = std::move(it->second);
        held.erase(it);
        cb(healthy);
    }

    bool autoAnswer{false};
    std::map<std::string, bool> answers;
    std::map<std::string, CheckCallback> held;
    std::atomic<int> checks{0};
};

const std::string kA = "127.0.0.1:8001";
const std::string kB = "127.0.0.1:8002";
const std::string kC = "127.0.0.1:8003";

} // namespace

int main() {
    common::Logger::Instance().SetLevel(common::LogLevel::INFO);
    network::EventLoop loop;

    auto topology = std::make_shared<Topology>(
        std::vector<Backend>{{kA, "/health"}, {kB, "/health"}, {kC, "/health"}},
        std::vector<PathRoute>{{"/api", kC}});
    auto health = std::make_shared<HealthState>(3);
    auto checker = std::make_shared<ScriptedChecker>(&loop);
    auto monitor = std::make_shared<HealthMonitor>(&loop, topology, health, checker, 0.05);

    std::vector<std::vector<bool>> committed;
    monitor->SetTickCallback([&](const std::vector<bool>& results) { committed.push_back(results); });

    // First round goes out immediately.
    assert(monitor->Start());
    assert(checker->checks == 3);
    assert(monitor->TickInFlight());
    assert(health->HealthyCount() == 3);

    std::atomic<bool> ok{true};
    auto check = [&ok](bool cond, const char* what) {
        if (!cond) {
            LOG_ERROR << "HealthMonitor check failed: " << what;
            ok = false;
        }
    };

    std::thread driver([&]() {
        // Several timer periods pass while the first round is unanswered.
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
        loop.RunInLoop([&]() {
            check(monitor->SkippedTicks() >= 1, "ticks skipped while in flight");
            check(checker->checks == 3, "no new checks while in flight");
            check(health->HealthyCount() == 3, "initially healthy");

            checker->Answer(kA, false);
            checker->Answer(kB, true);
            // Partial results are not visible.
            check(health->IsHealthy(0), "no partial commit");
            check(monitor->CompletedTicks() == 0, "tick still open");

            checker->Answer(kC, false);
            check((health->Snapshot() == std::vector<bool>{false, true, false}), "whole round committed");
            check(monitor->CompletedTicks() == 1, "one tick completed");
            check(!monitor->TickInFlight(), "tick closed");
            check(committed.size() == 1, "tick callback ran");

            auto backends = monitor::Stats::Instance().GetBackendSnapshot();
            check(backends.size() == 3, "stats snapshot size");
            check(backends.size() == 3 && backends[2].pathRouted && !backends[2].healthy, "stats snapshot flags");

            checker->answers = {{kA, true}, {kB, true}, {kC, true}};
            checker->autoAnswer = true;
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(250));
        loop.RunInLoop([&]() {
            check(monitor->CompletedTicks() >= 2, "timer keeps ticking");
            check(health->HealthyCount() == 3, "recovered");
            monitor->Stop();
            loop.Quit();
        });
    });

    loop.Loop();
    driver.join();

    // No backends: every tick commits an empty round straight away.
    {
        network::EventLoop* l = &loop;
        auto emptyTopology = std::make_shared<Topology>();
        auto emptyHealth = std::make_shared<HealthState>(0);
        auto emptyMonitor = std::make_shared<HealthMonitor>(l, emptyTopology, emptyHealth,
                                                            std::make_shared<ScriptedChecker>(l), 60);
        assert(emptyMonitor->Start());
        assert(emptyMonitor->CompletedTicks() == 1);
        assert(!emptyMonitor->TickInFlight());
        emptyMonitor->Stop();
    }

    if (!ok) {
        LOG_ERROR << "HealthMonitor: FAIL";
        return 1;
    }
    LOG_INFO << "HealthMonitor: PASS";
    return 0;
}
