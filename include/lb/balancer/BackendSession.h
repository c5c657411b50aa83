#pragma once

#include "lb/common/noncopyable.h"
#include "lb/network/Connector.h"
#include "lb/network/InetAddress.h"
#include "lb/network/Resolver.h"
#include "lb/network/TcpConnection.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace lb {
namespace balancer {

// One client connection tunnelled to one backend. Lives on the client's I/O
// loop; every method must be called from that loop.
//
// The client's context and the open backend connection's context each hold
// the session, so it outlives whichever side closes first.
class BackendSession : public std::enable_shared_from_this<BackendSession>,
                       lb::common::noncopyable {
public:
    struct TunnelConfig {
        size_t highWaterMarkBytes;
        double connectTimeoutSec;

        TunnelConfig()
            : highWaterMarkBytes(8 * 1024 * 1024),
              connectTimeoutSec(0) {}
    };

    BackendSession(lb::network::EventLoop* loop,
                   const std::string& backendAddress,
                   const lb::network::TcpConnectionPtr& clientConn,
                   std::shared_ptr<lb::network::Resolver> resolver,
                   TunnelConfig tunnelCfg = TunnelConfig());
    ~BackendSession();

    // Pauses client reads, resolves and connects. `initialBytes` reach the
    // backend before anything else, then client reads resume.
    void Start(std::string initialBytes);

    // Client bytes read after the initial chunk.
    void Send(lb::network::Buffer* buf);

    // The client sent FIN: once everything it sent has reached the backend,
    // half-close the backend so it sees the end of the request stream. The
    // backend's reply still flows back.
    void OnClientEof();

    // The client connection is gone: flush what is queued toward the backend, then close it.
    void OnClientClose();

    bool connected() const { return backendConn_ != nullptr; }
    const std::string& backendAddress() const { return backendAddress_; }

private:
    void Connect(const lb::network::InetAddress& addr);
    void OnConnected(int sockfd);
    void OnConnectFailed(int err);
    void OnBackendMessage(lb::network::Buffer* buf);
    void OnBackendClose(const lb::network::TcpConnectionPtr& conn);
    void InstallBackpressure(const lb::network::TcpConnectionPtr& client);

    lb::network::EventLoop* loop_;
    const std::string backendAddress_;
    lb::network::InetAddress backendAddr_;
    std::weak_ptr<lb::network::TcpConnection> clientConn_;
    lb::network::TcpConnectionPtr backendConn_;
    lb::network::ConnectorPtr connector_;
    std::shared_ptr<lb::network::Resolver> resolver_;
    std::string pending_; // client bytes waiting for the backend connect
    bool clientEof_;
    bool clientClosed_;
    TunnelConfig tunnelCfg_;
    std::chrono::steady_clock::time_point startTime_;
};

using BackendSessionPtr = std::shared_ptr<BackendSession>;

} // namespace balancer
} // namespace lb
