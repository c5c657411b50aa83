#pragma once

#include <netinet/in.h>

#include <cstdint>
#include <string>

namespace lb {
namespace network {

// IPv4 socket address.
class InetAddress {
public:
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);
    InetAddress(const std::string& ip, uint16_t port);
    explicit InetAddress(const struct sockaddr_in& addr)
        : addr_(addr) {}

    sa_family_t family() const { return addr_.sin_family; }
    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }
    void setSockAddr(const struct sockaddr_in& addr) { addr_ = addr; }

    // Splits "host:port" at the last ':'. Rejects an empty host and ports
    // outside 1..65535.
    static bool SplitHostPort(const std::string& hostport, std::string* host, uint16_t* port);

    // "a.b.c.d:port" only; never touches DNS.
    static bool ParseNumeric(const std::string& hostport, InetAddress* out);

    // Resolves "host:port" (dotted quad or DNS name) to the first IPv4 address.
    // Blocks on getaddrinfo for names that are not numeric; keep it off
    // event loop threads (see Resolver).
    static bool Resolve(const std::string& hostport, InetAddress* out, std::string* error);

private:
    struct sockaddr_in addr_;
};

} // namespace network
} // namespace lb
