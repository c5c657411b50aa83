#pragma once

#include "lb/common/noncopyable.h"
#include "lb/network/EventLoop.h"
#include "lb/network/InetAddress.h"

#include <functional>
#include <memory>

namespace lb {
namespace network {

class Channel;

// One non-blocking connect attempt, optionally bounded by a timeout. Exactly
// one of the callbacks fires, on the loop thread, unless Stop() comes first.
// Must be owned by a shared_ptr; call Stop() before dropping one that is
// still connecting.
class Connector : public std::enable_shared_from_this<Connector>,
                  lb::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd)>;
    using FailureCallback = std::function<void(int err)>;

    // timeoutSeconds <= 0 leaves the connect to the kernel's own limits.
    Connector(EventLoop* loop, const InetAddress& serverAddr, double timeoutSeconds = 0);
    ~Connector();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) { newConnectionCallback_ = cb; }
    void SetFailureCallback(const FailureCallback& cb) { failureCallback_ = cb; }

    void Start();
    void Stop();

    const InetAddress& serverAddress() const { return serverAddr_; }

private:
    enum States { kDisconnected, kConnecting, kConnected };

    void StartInLoop();
    void StopInLoop();
    void Connecting(int sockfd);
    void HandleWrite();
    void HandleError();
    void HandleTimeout();
    void Fail(int sockfd, int err);
    int RemoveAndResetChannel();

    EventLoop* loop_;
    InetAddress serverAddr_;
    double timeoutSeconds_;
    States state_;
    std::unique_ptr<Channel> channel_;
    NewConnectionCallback newConnectionCallback_;
    FailureCallback failureCallback_;
    EventLoop::TimerId timeoutTimer_;
};

using ConnectorPtr = std::shared_ptr<Connector>;

} // namespace network
} // namespace lb
