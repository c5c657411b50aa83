#pragma once

#include "lb/common/noncopyable.h"
#include "lb/network/Callbacks.h"
#include "lb/network/InetAddress.h"
#include "lb/network/TcpConnection.h"

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace lb {
namespace network {

class Acceptor;
class EventLoop;
class EventLoopThread;

// Accepts on the base loop and deals connections round-robin across its I/O
// loops. Connection callbacks run on the connection's I/O loop.
class TcpServer : lb::common::noncopyable {
public:
    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg);
    ~TcpServer();

    // Number of I/O threads; 0 keeps every connection on the base loop.
    // Must be called before Start().
    void SetThreadNum(int numThreads) { numThreads_ = numThreads; }

    // Starts the I/O loops and begins listening. Call from the base loop's
    // thread. Returns false if the listen socket could not be set up.
    bool Start();

    // Bound address once started; reports the kernel-chosen port for port 0.
    InetAddress listenAddress() const;

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    // Installed on every accepted connection; see TcpConnection.
    void SetHalfCloseCallback(const HalfCloseCallback& cb) { halfCloseCallback_ = cb; }

private:
    EventLoop* NextIoLoop();
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;

    int numThreads_;
    std::vector<std::unique_ptr<EventLoopThread>> ioThreads_;
    std::vector<EventLoop*> ioLoops_;
    size_t nextIoLoop_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    HalfCloseCallback halfCloseCallback_;

    std::atomic_bool started_;
    uint64_t nextConnId_;
    std::map<std::string, TcpConnectionPtr> connections_;
};

} // namespace network
} // namespace lb
