#pragma once

#include "lb/common/noncopyable.h"

namespace lb {
namespace network {

class InetAddress;

// Owns a socket fd and closes it on destruction.
class Socket : lb::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    bool BindAddress(const InetAddress& localaddr);
    bool Listen();
    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetKeepAlive(bool on);

    // Pending SO_ERROR on the socket, 0 if none.
    static int GetSocketError(int sockfd);
    static int CreateNonblocking();

private:
    const int sockfd_;
};

} // namespace network
} // namespace lb
