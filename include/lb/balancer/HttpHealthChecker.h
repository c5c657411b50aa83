#pragma once

#include "lb/balancer/HealthChecker.h"
#include "lb/network/Channel.h"
#include "lb/network/EventLoop.h"
#include "lb/network/InetAddress.h"
#include "lb/network/Resolver.h"

#include <memory>
#include <string>

namespace lb {
namespace balancer {

// "GET {healthCheckPath}" over a fresh connection with a per-check timeout
// that also bounds the name lookup. Healthy only when the status line
// carries a 2xx code.
class HttpHealthChecker : public HealthChecker,
                          public std::enable_shared_from_this<HttpHealthChecker> {
public:
    // Without a resolver the checker starts its own single lookup thread.
    HttpHealthChecker(lb::network::EventLoop* loop,
                      double timeoutSec = 2.0,
                      std::shared_ptr<lb::network::Resolver> resolver = nullptr);
    ~HttpHealthChecker() override = default;

    void Check(const Backend& backend, CheckCallback cb) override;

    // Status code from "HTTP/x.y NNN reason", or -1 when malformed.
    static int ParseHttpStatusCode(const std::string& statusLine);
    static std::string BuildRequest(const Backend& backend);

private:
    enum class State { kResolving, kConnecting, kSending, kReading };

    struct CheckContext {
        int sockfd{-1};
        lb::network::EventLoop::TimerId timer{0};
        std::shared_ptr<lb::network::Channel> connChannel;
        CheckCallback cb;
        std::string address;

        State state{State::kResolving};
        std::string out;
        size_t outOffset{0};
        std::string in;
        bool finished{false};
    };
    using CheckContextPtr = std::shared_ptr<CheckContext>;

    void Start(const Backend& backend, CheckCallback cb);
    void Connect(const CheckContextPtr& ctx, const lb::network::InetAddress& addr);
    void OnWritable(const CheckContextPtr& ctx);
    void OnReadable(const CheckContextPtr& ctx);
    void OnTimeout(const CheckContextPtr& ctx);
    void Finish(const CheckContextPtr& ctx, bool healthy);
    bool CleanUp(const CheckContextPtr& ctx);

    double timeoutSec_;
    std::shared_ptr<lb::network::Resolver> resolver_;
};

} // namespace balancer
} // namespace lb
