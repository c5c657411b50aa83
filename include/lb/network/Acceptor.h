#pragma once

#include "lb/common/noncopyable.h"
#include "lb/network/Channel.h"
#include "lb/network/InetAddress.h"
#include "lb/network/Socket.h"

#include <functional>

namespace lb {
namespace network {

class EventLoop;

class Acceptor : lb::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        new_connection_callback_ = cb;
    }

    bool Listenning() const { return listenning_; }

    // Binds and starts listening. Returns false if the socket could not be
    // created, bound or put into listening state.
    bool Listen();

    // Actual bound address; useful when listening on port 0.
    InetAddress LocalAddress() const;

private:
    void HandleRead();

    EventLoop* loop_;
    InetAddress listen_addr_;
    Socket accept_socket_;
    Channel accept_channel_;
    NewConnectionCallback new_connection_callback_;
    bool listenning_;
};

} // namespace network
} // namespace lb
