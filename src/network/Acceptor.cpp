#include "lb/network/Acceptor.h"
#include "lb/network/EventLoop.h"
#include "lb/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace lb {
namespace network {

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr)
    : loop_(loop),
      listen_addr_(listenAddr),
      accept_socket_(Socket::CreateNonblocking()),
      accept_channel_(loop, accept_socket_.fd()),
      listenning_(false) {
    accept_socket_.SetReuseAddr(true);
    accept_channel_.SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
}

Acceptor::~Acceptor() {
    if (listenning_) {
        accept_channel_.DisableAll();
        accept_channel_.Remove();
    }
}

bool Acceptor::Listen() {
    if (accept_socket_.fd() < 0) return false;
    if (!accept_socket_.BindAddress(listen_addr_)) return false;
    if (!accept_socket_.Listen()) return false;
    listenning_ = true;
    accept_channel_.EnableReading();
    return true;
}

InetAddress Acceptor::LocalAddress() const {
    struct sockaddr_in addr;
    socklen_t len = sizeof addr;
    std::memset(&addr, 0, sizeof addr);
    if (::getsockname(accept_socket_.fd(), reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        return listen_addr_;
    }
    return InetAddress(addr);
}

void Acceptor::HandleRead() {
    InetAddress peerAddr;
    int connfd = accept_socket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (new_connection_callback_) {
            new_connection_callback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
    } else {
        LOG_ERROR << "accept failed: " << std::strerror(errno);
        if (errno == EMFILE) {
            LOG_ERROR << "sockfd reached limit";
        }
    }
}

} // namespace network
} // namespace lb
