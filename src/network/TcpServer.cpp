#include "lb/network/TcpServer.h"
#include "lb/network/Acceptor.h"
#include "lb/network/EventLoop.h"
#include "lb/network/EventLoopThread.h"
#include "lb/common/Logger.h"

#include <sys/socket.h>

#include <cstring>

namespace lb {
namespace network {

namespace {

InetAddress LocalAddressOf(int sockfd) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    if (::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        return InetAddress();
    }
    return InetAddress(addr);
}

} // namespace

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& nameArg)
    : loop_(loop),
      name_(nameArg),
      acceptor_(new Acceptor(loop, listenAddr)),
      numThreads_(0),
      nextIoLoop_(0),
      started_(false),
      nextConnId_(1) {
    acceptor_->SetNewConnectionCallback(
        [this](int sockfd, const InetAddress& peerAddr) { NewConnection(sockfd, peerAddr); });
}

TcpServer::~TcpServer() {
    for (auto& item : connections_) {
        TcpConnectionPtr conn(std::move(item.second));
        conn->getLoop()->RunInLoop([conn] { conn->ConnectDestroyed(); });
    }
    connections_.clear();
    // EventLoopThread destructors quit and join the I/O loops.
}

bool TcpServer::Start() {
    if (started_.exchange(true)) return acceptor_->Listenning();

    for (int i = 0; i < numThreads_; ++i) {
        std::unique_ptr<EventLoopThread> t(new EventLoopThread(name_ + "-io" + std::to_string(i)));
        ioLoops_.push_back(t->StartLoop());
        ioThreads_.push_back(std::move(t));
    }
    if (!acceptor_->Listen()) {
        LOG_ERROR << "TcpServer [" << name_ << "] cannot listen";
        return false;
    }
    LOG_INFO << "TcpServer [" << name_ << "] listening on " << acceptor_->LocalAddress().toIpPort()
             << " with " << numThreads_ << " I/O threads";
    return true;
}

InetAddress TcpServer::listenAddress() const {
    return acceptor_->LocalAddress();
}

EventLoop* TcpServer::NextIoLoop() {
    if (ioLoops_.empty()) return loop_;
    EventLoop* ioLoop = ioLoops_[nextIoLoop_];
    nextIoLoop_ = (nextIoLoop_ + 1) % ioLoops_.size();
    return ioLoop;
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    const std::string connName = name_ + "#" + std::to_string(nextConnId_++) + "@" + peerAddr.toIpPort();
    LOG_DEBUG << "TcpServer [" << name_ << "] accepted " << connName;

    EventLoop* ioLoop = NextIoLoop();
    TcpConnectionPtr conn = std::make_shared<TcpConnection>(ioLoop,
                                                            connName,
                                                            sockfd,
                                                            LocalAddressOf(sockfd),
                                                            peerAddr);
    connections_[connName] = conn;
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetHalfCloseCallback(halfCloseCallback_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { RemoveConnection(c); });

    ioLoop->RunInLoop([conn] { conn->ConnectEstablished(); });
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // Runs on the connection's I/O loop; the map belongs to the base loop.
    loop_->QueueInLoop([this, conn] {
        connections_.erase(conn->name());
        conn->getLoop()->QueueInLoop([conn] { conn->ConnectDestroyed(); });
    });
}

} // namespace network
} // namespace lb
