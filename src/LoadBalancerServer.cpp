#include "lb/LoadBalancerServer.h"
#include "lb/balancer/HttpHealthChecker.h"
#include "lb/common/Logger.h"
#include "lb/monitor/Stats.h"
#include "lb/protocol/HttpResponse.h"
#include "lb/protocol/RequestLine.h"

#include <algorithm>

namespace lb {

namespace {

const size_t kResolverThreads = 2;

ProxySessionContextPtr GetSessionContext(const network::TcpConnectionPtr& conn) {
    auto* ctxPtr = std::any_cast<ProxySessionContextPtr>(conn->GetMutableContext());
    return ctxPtr ? *ctxPtr : nullptr;
}

} // namespace

LoadBalancerServer::LoadBalancerServer(network::EventLoop* loop,
                                       const ServerOptions& options,
                                       balancer::HealthCheckerPtr checker,
                                       const std::string& name)
    : loop_(loop),
      options_(options),
      server_(loop, network::InetAddress(options.listenPort), name),
      resolver_(std::make_shared<network::Resolver>(kResolverThreads)),
      topology_(std::make_shared<balancer::Topology>(options.backends, options.routes)),
      health_(std::make_shared<balancer::HealthState>(options.backends.size())),
      router_(new balancer::RoutingEngine(topology_, health_)) {
    if (!checker) {
        checker = std::make_shared<balancer::HttpHealthChecker>(loop, options.healthCheckTimeoutSec, resolver_);
    }
    monitor_ = std::make_shared<balancer::HealthMonitor>(
        loop, topology_, health_, std::move(checker), options.healthCheckIntervalSec);

    server_.SetThreadNum(options.threads);
    server_.SetConnectionCallback(
        [this](const network::TcpConnectionPtr& conn) { OnConnection(conn); });
    server_.SetMessageCallback(
        [this](const network::TcpConnectionPtr& conn, network::Buffer* buf,
               std::chrono::system_clock::time_point t) { OnMessage(conn, buf, t); });
    server_.SetHalfCloseCallback(
        [this](const network::TcpConnectionPtr& conn) { OnClientEof(conn); });
}

LoadBalancerServer::~LoadBalancerServer() {
    monitor_->Stop();
}

bool LoadBalancerServer::Start() {
    if (topology_->BackendCount() == 0) {
        LOG_WARN << "No backends configured: every connection without a path route gets 503";
    }
    for (const auto& b : topology_->backends()) {
        LOG_INFO << "Backend " << b.address << " (health check " << b.healthCheckPath << ")";
    }
    for (const auto& r : topology_->routes()) {
        LOG_INFO << "Path route " << r.pathPrefix << " -> " << r.address;
    }

    if (!server_.Start()) return false;
    if (!monitor_->Start()) {
        LOG_ERROR << "Health monitor failed to start";
        return false;
    }
    LOG_INFO << "Load balancer running on " << server_.listenAddress().toIpPort();
    return true;
}

void LoadBalancerServer::OnConnection(const network::TcpConnectionPtr& conn) {
    auto& stats = monitor::Stats::Instance();
    if (conn->connected()) {
        LOG_DEBUG << "New connection from " << conn->peerAddress().toIpPort();
        stats.IncAcceptedConnections();
        stats.IncActiveConnections();
        conn->SetContext(std::make_shared<ProxySessionContext>());
        return;
    }

    LOG_DEBUG << "Connection closed: " << conn->name();
    stats.DecActiveConnections();
    ProxySessionContextPtr ctx = GetSessionContext(conn);
    conn->SetContext(std::any());
    if (ctx) {
        ctx->state = ProxySessionContext::kClosing;
        if (ctx->backendSession) {
            ctx->backendSession->OnClientClose();
            ctx->backendSession.reset();
        }
    }
}

void LoadBalancerServer::OnMessage(const network::TcpConnectionPtr& conn,
                                   network::Buffer* buf,
                                   std::chrono::system_clock::time_point) {
    ProxySessionContextPtr ctx = GetSessionContext(conn);
    if (!ctx) {
        buf->RetrieveAll();
        return;
    }

    switch (ctx->state) {
        case ProxySessionContext::kAwaitingRequest:
            RouteFirstChunk(conn, ctx, buf);
            break;
        case ProxySessionContext::kProxying:
            if (ctx->backendSession) {
                ctx->backendSession->Send(buf);
            } else {
                buf->RetrieveAll();
            }
            break;
        case ProxySessionContext::kClosing:
            buf->RetrieveAll();
            break;
    }
}

void LoadBalancerServer::OnClientEof(const network::TcpConnectionPtr& conn) {
    ProxySessionContextPtr ctx = GetSessionContext(conn);
    if (!ctx) {
        conn->ForceClose();
        return;
    }

    switch (ctx->state) {
        case ProxySessionContext::kAwaitingRequest: {
            // FIN before any byte: route the empty stream like any other.
            network::Buffer empty;
            RouteFirstChunk(conn, ctx, &empty);
            if (ctx->state == ProxySessionContext::kProxying && ctx->backendSession) {
                ctx->backendSession->OnClientEof();
            }
            break;
        }
        case ProxySessionContext::kProxying:
            if (ctx->backendSession) {
                ctx->backendSession->OnClientEof();
            } else {
                conn->CloseAfterDrain();
            }
            break;
        case ProxySessionContext::kClosing:
            conn->CloseAfterDrain();
            break;
    }
}

void LoadBalancerServer::RouteFirstChunk(const network::TcpConnectionPtr& conn,
                                         const ProxySessionContextPtr& ctx,
                                         network::Buffer* buf) {
    const size_t peek = std::min(buf->ReadableBytes(), options_.peekBytes);
    ctx->requestPath = protocol::ExtractRequestPath(buf->Peek(), peek);
    ctx->decision = router_->Route(ctx->requestPath);

    auto& stats = monitor::Stats::Instance();
    const auto& d = ctx->decision;
    LOG_INFO << "Request path: " << ctx->requestPath << " from " << conn->peerAddress().toIpPort()
             << " -> " << balancer::RouteKindName(d.kind)
             << (d.available() ? " " + d.address : std::string());

    if (!d.available()) {
        LOG_WARN << "No healthy backends available";
        stats.IncUnavailable();
        ctx->state = ProxySessionContext::kClosing;
        buf->RetrieveAll();
        conn->Send(protocol::ServiceUnavailableResponse());
        conn->CloseAfterDrain();
        return;
    }

    if (d.kind == balancer::RouteDecision::kPathRouted) {
        stats.IncPathRouted();
    } else {
        stats.IncRoundRobinRouted();
    }

    balancer::BackendSession::TunnelConfig tcfg;
    tcfg.highWaterMarkBytes = options_.highWaterMarkBytes;
    tcfg.connectTimeoutSec = options_.connectTimeoutSec;

    auto session = std::make_shared<balancer::BackendSession>(conn->getLoop(), d.address, conn,
                                                              resolver_, tcfg);
    ctx->backendSession = session;
    ctx->state = ProxySessionContext::kProxying;
    // Everything read so far, not just the routed prefix, goes to the backend first.
    session->Start(buf->RetrieveAllAsString());
}

} // namespace lb
