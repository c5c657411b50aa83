#pragma once

#include "lb/common/noncopyable.h"
#include "lb/network/InetAddress.h"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lb {
namespace network {

class EventLoop;

// Turns "host:port" into an address without stalling an event loop.
// Numeric addresses and malformed input complete inline; names are looked
// up on a worker thread and the callback is queued back onto the caller's
// loop. Requests still queued when the resolver is destroyed never call back.
class Resolver : lb::common::noncopyable {
public:
    using LookupFunction = std::function<bool(const std::string& hostport, InetAddress* out, std::string* error)>;
    using ResolveCallback = std::function<void(bool ok, const InetAddress& addr, const std::string& error)>;

    explicit Resolver(size_t numWorkers = 1, LookupFunction lookup = &InetAddress::Resolve);
    ~Resolver();

    void Resolve(EventLoop* loop, const std::string& hostport, ResolveCallback cb);

    size_t PendingLookups() const;

private:
    struct Request {
        EventLoop* loop{nullptr};
        std::string hostport;
        ResolveCallback cb;
    };

    void WorkerMain();

    LookupFunction lookup_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<Request> queue_;
    bool stopping_;
};

} // namespace network
} // namespace lb
