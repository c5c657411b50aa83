#include "lb/network/Resolver.h"
#include "lb/network/EventLoop.h"
#include "lb/common/Logger.h"

namespace lb {
namespace network {

Resolver::Resolver(size_t numWorkers, LookupFunction lookup)
    : lookup_(std::move(lookup)),
      stopping_(false) {
    if (numWorkers == 0) numWorkers = 1;
    for (size_t i = 0; i < numWorkers; ++i) {
        workers_.emplace_back([this] { WorkerMain(); });
    }
}

Resolver::~Resolver() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        queue_.clear();
    }
    cond_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

void Resolver::Resolve(EventLoop* loop, const std::string& hostport, ResolveCallback cb) {
    InetAddress addr;
    if (InetAddress::ParseNumeric(hostport, &addr)) {
        cb(true, addr, std::string());
        return;
    }
    std::string host;
    uint16_t port = 0;
    if (!InetAddress::SplitHostPort(hostport, &host, &port)) {
        cb(false, addr, "invalid host:port '" + hostport + "'");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(Request{loop, hostport, std::move(cb)});
    }
    cond_.notify_one();
}

size_t Resolver::PendingLookups() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void Resolver::WorkerMain() {
    while (true) {
        Request req;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cond_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) return;
            req = std::move(queue_.front());
            queue_.pop_front();
        }

        InetAddress addr;
        std::string error;
        const bool ok = lookup_(req.hostport, &addr, &error);
        if (!ok) {
            LOG_DEBUG << "resolve " << req.hostport << ": " << error;
        }

        {
            // The owner may be tearing down while the lookup ran.
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) return;
        }
        ResolveCallback cb = std::move(req.cb);
        req.loop->QueueInLoop([cb, ok, addr, error] { cb(ok, addr, error); });
    }
}

} // namespace network
} // namespace lb
