#pragma once

#include "lb/ProxySessionContext.h"
#include "lb/ServerOptions.h"
#include "lb/balancer/HealthChecker.h"
#include "lb/balancer/HealthMonitor.h"
#include "lb/balancer/HealthState.h"
#include "lb/balancer/RoutingEngine.h"
#include "lb/balancer/Topology.h"
#include "lb/network/EventLoop.h"
#include "lb/network/Resolver.h"
#include "lb/network/TcpServer.h"

#include <memory>
#include <string>

namespace lb {

// Accepts client connections, routes each on its first chunk of bytes and
// tunnels it to the chosen backend. Owns the health monitor for the backends.
class LoadBalancerServer {
public:
    // `checker` defaults to an HttpHealthChecker on `loop`.
    LoadBalancerServer(network::EventLoop* loop,
                       const ServerOptions& options,
                       balancer::HealthCheckerPtr checker = nullptr,
                       const std::string& name = "LoadBalancer");
    ~LoadBalancerServer();

    // Listens and starts health monitoring. Call from the loop thread.
    // False if either cannot be started.
    bool Start();

    network::InetAddress listenAddress() const { return server_.listenAddress(); }

    const std::shared_ptr<const balancer::Topology>& topology() const { return topology_; }
    const std::shared_ptr<balancer::HealthState>& healthState() const { return health_; }
    balancer::RoutingEngine& routingEngine() { return *router_; }
    balancer::HealthMonitor& healthMonitor() { return *monitor_; }

private:
    void OnConnection(const network::TcpConnectionPtr& conn);
    void OnMessage(const network::TcpConnectionPtr& conn,
                   network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void OnClientEof(const network::TcpConnectionPtr& conn);
    void RouteFirstChunk(const network::TcpConnectionPtr& conn,
                         const ProxySessionContextPtr& ctx,
                         network::Buffer* buf);

    network::EventLoop* loop_;
    ServerOptions options_;
    network::TcpServer server_;
    // Shared with sessions and the health checker; lookups post back onto
    // the asking loop.
    std::shared_ptr<network::Resolver> resolver_;

    std::shared_ptr<const balancer::Topology> topology_;
    std::shared_ptr<balancer::HealthState> health_;
    std::unique_ptr<balancer::RoutingEngine> router_;
    std::shared_ptr<balancer::HealthMonitor> monitor_;
};

} // namespace lb
