#include "lb/balancer/HttpHealthChecker.h"
#include "lb/common/Logger.h"
#include "lb/network/EventLoop.h"
#include "lb/network/InetAddress.h"
#include "lb/network/Resolver.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace lb;

namespace {

// Stands in for getaddrinfo: answers 127.0.0.1 with the requested port, but
// only after `release` is set.
struct StalledLookup {
    std::atomic<bool> release{false};
    std::atomic<int> calls{0};

    network::Resolver::LookupFunction Function() {
        return [this](const std::string& hostport, network::InetAddress* out, std::string* error) {
            calls++;
            const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
            while (!release && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            std::string host;
            uint16_t port = 0;
            if (!network::InetAddress::SplitHostPort(hostport, &host, &port)) {
                *error = "bad address";
                return false;
            }
            *out = network::InetAddress("127.0.0.1", port);
            return true;
        };
    }
};

void TestInlineCompletion() {
    network::EventLoop loop;
    StalledLookup lookup;
    lookup.release = true;
    network::Resolver resolver(1, lookup.Function());

    bool called = false;
    resolver.Resolve(&loop, "10.1.2.3:8080",
        [&](bool ok, const network::InetAddress& addr, const std::string&) {
            assert(ok);
            assert(addr.toIpPort() == "10.1.2.3:8080");
            called = true;
        });
    assert(called);

    called = false;
    resolver.Resolve(&loop, "no-port-here",
        [&](bool ok, const network::InetAddress&, const std::string& error) {
            assert(!ok);
            assert(!error.empty());
            called = true;
        });
    assert(called);
    assert(lookup.calls == 0);
    LOG_INFO << "Resolver inline completion: PASS";
}

void TestSlowLookupLeavesLoopResponsive() {
    network::EventLoop loop;
    StalledLookup lookup;
    network::Resolver resolver(1, lookup.Function());

    bool timerRan = false;
    bool resolved = false;
    std::string resolvedTo;
    resolver.Resolve(&loop, "backend.test:9000",
        [&](bool ok, const network::InetAddress& addr, const std::string&) {
            assert(loop.IsInLoopThread());
            assert(ok);
            resolved = true;
            resolvedTo = addr.toIpPort();
            loop.Quit();
        });
    assert(!resolved);

    // Runs while the lookup is still blocked on the worker.
    loop.RunAfter(0.05, [&] {
        assert(!resolved);
        timerRan = true;
        lookup.release = true;
    });
    loop.RunAfter(10.0, [&] { loop.Quit(); });
    loop.Loop();

    assert(timerRan);
    assert(resolved);
    assert(resolvedTo == "127.0.0.1:9000");
    assert(lookup.calls == 1);
    LOG_INFO << "Resolver keeps loop responsive: PASS";
}

void TestHealthCheckTimeoutCoversLookup() {
    network::EventLoop loop;
    StalledLookup lookup;
    auto resolver = std::make_shared<network::Resolver>(1, lookup.Function());
    auto checker = std::make_shared<balancer::HttpHealthChecker>(&loop, 0.2, resolver);

    int calls = 0;
    bool healthy = true;
    const auto started = std::chrono::steady_clock::now();
    checker->Check(balancer::Backend{"stalled.test:80", "/health"}, [&](bool h) {
        ++calls;
        healthy = h;
        loop.Quit();
    });
    loop.RunAfter(10.0, [&] { loop.Quit(); });
    loop.Loop();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    assert(calls == 1);
    assert(!healthy);
    assert(elapsed < std::chrono::seconds(2));

    // A late lookup result must not report a second time.
    lookup.release = true;
    loop.RunAfter(0.1, [&] { loop.Quit(); });
    loop.Loop();
    assert(calls == 1);
    LOG_INFO << "Health check timeout covers lookup: PASS";
}

} // namespace

int main() {
    common::Logger::Instance().SetLevel(common::LogLevel::INFO);
    TestInlineCompletion();
    TestSlowLookupLeavesLoopResponsive();
    TestHealthCheckTimeoutCoversLookup();
    return 0;
}
