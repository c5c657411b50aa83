#pragma once

#include "lb/balancer/BackendSession.h"
#include "lb/balancer/RoutingEngine.h"

#include <memory>
#include <string>

namespace lb {

// Per client connection, stored in the TcpConnection context:
// kAwaitingRequest -> kProxying (routed) or kClosing (503 sent or closed).
struct ProxySessionContext {
    enum State {
        kAwaitingRequest,
        kProxying,
        kClosing
    };

    State state = kAwaitingRequest;
    std::string requestPath;
    balancer::RouteDecision decision;
    std::shared_ptr<balancer::BackendSession> backendSession;
};

using ProxySessionContextPtr = std::shared_ptr<ProxySessionContext>;

} // namespace lb
