#include "lb/common/Logger.h"
#include "lb/network/EventLoop.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <thread>
#include <vector>

using namespace lb;

namespace {

void TestTimersFireInOrder() {
    network::EventLoop loop;
    std::vector<int> order;
    loop.RunAfter(0.15, [&] { order.push_back(3); loop.Quit(); });
    loop.RunAfter(0.05, [&] { order.push_back(1); });
    loop.RunAfter(0.10, [&] { order.push_back(2); });
    const network::EventLoop::TimerId cancelled = loop.RunAfter(0.07, [&] { order.push_back(99); });
    assert(cancelled != 0);
    loop.Cancel(cancelled);
    loop.Cancel(cancelled); // already gone
    loop.Loop();

    assert((order == std::vector<int>{1, 2, 3}));
    LOG_INFO << "EventLoop one-shot timers: PASS";
}

void TestRepeatingTimerCancelsItself() {
    network::EventLoop loop;
    int fired = 0;
    network::EventLoop::TimerId every = 0;
    every = loop.RunEvery(0.01, [&] {
        if (++fired == 3) loop.Cancel(every);
    });
    loop.RunAfter(0.2, [&] { loop.Quit(); });
    loop.Loop();

    assert(fired == 3);
    LOG_INFO << "EventLoop repeating timer: PASS";
}

void TestQueueFromOtherThread() {
    network::EventLoop loop;
    std::atomic<bool> ranInLoop{false};
    std::thread other([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        loop.QueueInLoop([&] {
            ranInLoop = loop.IsInLoopThread();
            loop.Quit();
        });
    });
    // The poll would otherwise sleep for seconds; the wakeup ends it.
    const auto started = std::chrono::steady_clock::now();
    loop.Loop();
    other.join();

    assert(ranInLoop);
    assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
    LOG_INFO << "EventLoop cross-thread wakeup: PASS";
}

} // namespace

int main() {
    common::Logger::Instance().SetLevel(common::LogLevel::INFO);
    TestTimersFireInOrder();
    TestRepeatingTimerCancelsItself();
    TestQueueFromOtherThread();
    return 0;
}
