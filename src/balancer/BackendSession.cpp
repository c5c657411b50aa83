#include "lb/balancer/BackendSession.h"
#include "lb/network/EventLoop.h"
#include "lb/network/InetAddress.h"
#include "lb/common/Logger.h"
#include "lb/monitor/Stats.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace lb {
namespace balancer {

namespace {

lb::network::InetAddress LocalAddressOf(int sockfd) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    if (::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        LOG_DEBUG << "getsockname: " << std::strerror(errno);
        return lb::network::InetAddress();
    }
    return lb::network::InetAddress(addr);
}

lb::network::InetAddress PeerAddressOf(int sockfd, const lb::network::InetAddress& fallback) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    if (::getpeername(sockfd, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        LOG_DEBUG << "getpeername: " << std::strerror(errno);
        return fallback;
    }
    return lb::network::InetAddress(addr);
}

} // namespace

BackendSession::BackendSession(lb::network::EventLoop* loop,
                               const std::string& backendAddress,
                               const lb::network::TcpConnectionPtr& clientConn,
                               std::shared_ptr<lb::network::Resolver> resolver,
                               TunnelConfig tunnelCfg)
    : loop_(loop),
      backendAddress_(backendAddress),
      clientConn_(clientConn),
      resolver_(std::move(resolver)),
      clientEof_(false),
      clientClosed_(false),
      tunnelCfg_(tunnelCfg),
      startTime_(std::chrono::steady_clock::now()) {
}

BackendSession::~BackendSession() {
    LOG_DEBUG << "BackendSession to " << backendAddress_ << " destroyed";
}

void BackendSession::Start(std::string initialBytes) {
    pending_ = std::move(initialBytes);
    if (auto client = clientConn_.lock()) {
        client->StopRead();
    }

    std::weak_ptr<BackendSession> weakSelf = shared_from_this();
    resolver_->Resolve(loop_, backendAddress_,
        [weakSelf](bool ok, const lb::network::InetAddress& addr, const std::string& error) {
            auto self = weakSelf.lock();
            if (!self || self->clientClosed_) return;
            if (!ok) {
                LOG_ERROR << "Backend " << self->backendAddress_ << ": " << error;
                self->OnConnectFailed(0);
                return;
            }
            self->Connect(addr);
        });
}

void BackendSession::Connect(const lb::network::InetAddress& addr) {
    backendAddr_ = addr;
    std::weak_ptr<BackendSession> weakSelf = shared_from_this();
    connector_ = std::make_shared<lb::network::Connector>(loop_, addr, tunnelCfg_.connectTimeoutSec);
    connector_->SetNewConnectionCallback([weakSelf](int sockfd) {
        if (auto self = weakSelf.lock()) {
            self->OnConnected(sockfd);
        } else {
            ::close(sockfd);
        }
    });
    connector_->SetFailureCallback([weakSelf](int err) {
        if (auto self = weakSelf.lock()) self->OnConnectFailed(err);
    });
    connector_->Start();
}

void BackendSession::OnConnected(int sockfd) {
    connector_.reset();
    auto client = clientConn_.lock();
    if (!client || clientClosed_) {
        ::close(sockfd);
        return;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime_).count();
    LOG_DEBUG << "Connected to backend " << backendAddress_ << " in " << elapsed << "ms for "
              << client->peerAddress().toIpPort();

    auto conn = std::make_shared<lb::network::TcpConnection>(
        loop_, client->name() + "->" + backendAddress_, sockfd,
        LocalAddressOf(sockfd), PeerAddressOf(sockfd, backendAddr_));
    backendConn_ = conn;

    std::weak_ptr<BackendSession> weakSelf = shared_from_this();
    conn->SetContext(shared_from_this());
    conn->SetMessageCallback([weakSelf](const lb::network::TcpConnectionPtr&,
                                        lb::network::Buffer* buf,
                                        std::chrono::system_clock::time_point) {
        if (auto self = weakSelf.lock()) {
            self->OnBackendMessage(buf);
        } else {
            buf->RetrieveAll();
        }
    });
    conn->SetCloseCallback([](const lb::network::TcpConnectionPtr& c) {
        BackendSessionPtr self;
        if (auto* held = std::any_cast<BackendSessionPtr>(c->GetMutableContext())) {
            self = *held;
        }
        c->SetContext(std::any());
        if (self) self->OnBackendClose(c);
        c->getLoop()->QueueInLoop([c] { c->ConnectDestroyed(); });
    });
    conn->ConnectEstablished();

    // Bytes read before the backend was chosen go out first.
    if (!pending_.empty()) {
        lb::monitor::Stats::Instance().AddBytesUpstream(static_cast<long long>(pending_.size()));
        conn->Send(pending_);
        pending_.clear();
    }

    InstallBackpressure(client);
    if (clientEof_) {
        conn->Shutdown();
    } else {
        client->StartRead();
    }
}

void BackendSession::InstallBackpressure(const lb::network::TcpConnectionPtr& client) {
    const size_t hwm = tunnelCfg_.highWaterMarkBytes;
    std::weak_ptr<lb::network::TcpConnection> wClient = client;
    std::weak_ptr<lb::network::TcpConnection> wBackend = backendConn_;

    // Client -> Backend: backend output too large, stop reading from client.
    backendConn_->SetHighWaterMarkCallback(
        [wClient](const lb::network::TcpConnectionPtr&, size_t) {
            if (auto c = wClient.lock()) c->StopRead();
        },
        hwm);
    backendConn_->SetWriteCompleteCallback(
        [wClient](const lb::network::TcpConnectionPtr&) {
            if (auto c = wClient.lock()) c->StartRead();
        });

    // Backend -> Client: client output too large, stop reading from backend.
    client->SetHighWaterMarkCallback(
        [wBackend](const lb::network::TcpConnectionPtr&, size_t) {
            if (auto b = wBackend.lock()) b->StopRead();
        },
        hwm);
    client->SetWriteCompleteCallback(
        [wBackend](const lb::network::TcpConnectionPtr&) {
            if (auto b = wBackend.lock()) b->StartRead();
        });
}

void BackendSession::OnConnectFailed(int err) {
    connector_.reset();
    lb::monitor::Stats::Instance().IncBackendConnectFailures();
    auto client = clientConn_.lock();
    LOG_ERROR << "Failed to connect to backend " << backendAddress_
              << (err ? std::string(": ") + std::strerror(err) : std::string())
              << (client ? " for " + client->peerAddress().toIpPort() : std::string());
    pending_.clear();
    if (client) client->ForceClose();
}

void BackendSession::Send(lb::network::Buffer* buf) {
    const size_t n = buf->ReadableBytes();
    if (n == 0) return;
    if (backendConn_) {
        lb::monitor::Stats::Instance().AddBytesUpstream(static_cast<long long>(n));
        backendConn_->Send(buf->Peek(), n);
    } else {
        pending_.append(buf->Peek(), n);
    }
    buf->RetrieveAll();
}

void BackendSession::OnBackendMessage(lb::network::Buffer* buf) {
    auto client = clientConn_.lock();
    if (client && buf->ReadableBytes() > 0) {
        lb::monitor::Stats::Instance().AddBytesDownstream(static_cast<long long>(buf->ReadableBytes()));
        client->Send(buf->Peek(), buf->ReadableBytes());
    }
    buf->RetrieveAll();
}

void BackendSession::OnBackendClose(const lb::network::TcpConnectionPtr& conn) {
    LOG_DEBUG << "Backend side closed: " << conn->name();
    backendConn_.reset();
    if (auto client = clientConn_.lock()) {
        client->CloseAfterDrain();
    }
}

void BackendSession::OnClientEof() {
    clientEof_ = true;
    LOG_DEBUG << "Client finished sending; half-closing toward " << backendAddress_;
    if (backendConn_) {
        backendConn_->Shutdown();
    }
    // Still connecting: OnConnected flushes pending_ and then shuts down.
}

void BackendSession::OnClientClose() {
    clientClosed_ = true;
    if (connector_) {
        connector_->Stop();
        connector_.reset();
    }
    if (backendConn_) {
        backendConn_->CloseAfterDrain();
    }
}

} // namespace balancer
} // namespace lb
