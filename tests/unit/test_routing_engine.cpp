#include "lb/balancer/HealthState.h"
#include "lb/balancer/RoutingEngine.h"
#include "lb/balancer/Topology.h"
#include "lb/common/Logger.h"

#include <cassert>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace lb::balancer;

namespace {

const std::string kA = "127.0.0.1:8001";
const std::string kB = "127.0.0.1:8002";
const std::string kC = "127.0.0.1:8003";

struct Fixture {
    std::shared_ptr<Topology> topology;
    std::shared_ptr<HealthState> health;
    std::unique_ptr<RoutingEngine> router;

    Fixture(std::vector<Backend> backends, std::vector<PathRoute> routes) {
        topology = std::make_shared<Topology>(std::move(backends), std::move(routes));
        health = std::make_shared<HealthState>(topology->BackendCount());
        router.reset(new RoutingEngine(topology, health));
    }
};

Fixture ThreeBackendsApiOnC() {
    return Fixture({{kA, "/health"}, {kB, "/health"}, {kC, "/health"}},
                   {{"/api", kC}});
}

void TestAlternatesOverHealthy() {
    Fixture f = ThreeBackendsApiOnC();
    std::vector<std::string> got;
    for (int i = 0; i < 4; ++i) {
        RouteDecision d = f.router->Route("/");
        assert(d.kind == RouteDecision::kRoundRobin);
        got.push_back(d.address);
    }
    assert((got == std::vector<std::string>{kA, kB, kA, kB}));
    assert(f.router->cursor() == 4);
}

void TestSkipsUnhealthy() {
    Fixture f = ThreeBackendsApiOnC();
    f.health->Commit({true, false, true});
    for (int i = 0; i < 5; ++i) {
        assert(f.router->Route("/index.html").address == kA);
    }
}

void TestPathRouteIgnoresHealth() {
    Fixture f = ThreeBackendsApiOnC();
    assert(f.router->Route("/api/x").address == kC);
    f.health->Commit({true, true, false});
    RouteDecision d = f.router->Route("/api/x");
    assert(d.kind == RouteDecision::kPathRouted);
    assert(d.address == kC);

    // Path routing does not move the cursor.
    assert(f.router->cursor() == 0);

    // Literal prefix: "/apix" also matches "/api".
    assert(f.router->Route("/apix").address == kC);
    assert(f.router->Route("/ap").kind == RouteDecision::kRoundRobin);
}

void TestUnavailable() {
    Fixture f = ThreeBackendsApiOnC();
    f.health->Commit({false, false, true});
    RouteDecision d = f.router->Route("/");
    assert(d.kind == RouteDecision::kUnavailable);
    assert(!d.available());
    assert(d.address.empty());

    // The path-routed backend is healthy but never a fallback.
    assert(f.router->Route("/other").kind == RouteDecision::kUnavailable);
    assert(f.router->Route("/api/ok").address == kC);

    Fixture none({}, {});
    assert(none.router->Route("/").kind == RouteDecision::kUnavailable);

    // A route may point at an address that is not a backend at all.
    Fixture external({}, {{"/ext", "10.1.1.1:80"}});
    assert(external.router->Route("/ext/a").address == "10.1.1.1:80");
}

void TestFirstRouteWins() {
    Fixture f({{kA, "/"}}, {{"/api", kB}, {"/api/v2", kC}});
    assert(f.router->Route("/api/v2/items").address == kB);
}

void TestCursorIsNotReset() {
    Fixture f({{kA, "/"}, {kB, "/"}, {kC, "/"}}, {});
    assert(f.router->Route("/").address == kA);   // cursor 0 % 3
    assert(f.router->Route("/").address == kB);   // cursor 1 % 3
    f.health->Commit({true, false, true});
    // Candidates shrink to [A, C]; the pick continues from cursor 2.
    assert(f.router->Route("/").address == kA);   // 2 % 2
    assert(f.router->Route("/").address == kC);   // 3 % 2
    assert(f.router->cursor() == 4);
}

void TestFairnessUnderThreads() {
    Fixture f({{kA, "/"}, {kB, "/"}, {kC, "/"}}, {});
    const int kThreads = 4;
    const int kPerThread = 3000;
    std::mutex mu;
    std::map<std::string, int> counts;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            std::map<std::string, int> local;
            for (int i = 0; i < kPerThread; ++i) local[f.router->Route("/").address]++;
            std::lock_guard<std::mutex> lock(mu);
            for (const auto& kv : local) counts[kv.first] += kv.second;
        });
    }
    for (auto& th : threads) th.join();

    const int total = kThreads * kPerThread;
    assert(f.router->cursor() == static_cast<uint64_t>(total));
    assert(counts.size() == 3);
    for (const auto& kv : counts) {
        assert(kv.second == total / 3);
    }
}

} // namespace

int main() {
    lb::common::Logger::Instance().SetLevel(lb::common::LogLevel::INFO);

    TestAlternatesOverHealthy();
    TestSkipsUnhealthy();
    TestPathRouteIgnoresHealth();
    TestUnavailable();
    TestFirstRouteWins();
    TestCursorIsNotReset();
    TestFairnessUnderThreads();

    assert(std::string(RouteKindName(RouteDecision::kRoundRobin)) == "round-robin");

    LOG_INFO << "RoutingEngine: PASS";
    return 0;
}
