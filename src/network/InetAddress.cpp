#include "lb/network/InetAddress.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

#include <cstdio>
#include <cstring>

namespace lb {
namespace network {

InetAddress::InetAddress(uint16_t port, bool loopbackOnly) {
    std::memset(&addr_, 0, sizeof addr_);
    addr_.sin_family = AF_INET;
    in_addr_t ip = loopbackOnly ? INADDR_LOOPBACK : INADDR_ANY;
    addr_.sin_addr.s_addr = htonl(ip);
    addr_.sin_port = htons(port);
}

InetAddress::InetAddress(const std::string& ip, uint16_t port) {
    std::memset(&addr_, 0, sizeof addr_);
    addr_.sin_family = AF_INET;
    addr_.sin_port = htons(port);
    if (::inet_pton(AF_INET, ip.c_str(), &addr_.sin_addr) <= 0) {
        addr_.sin_addr.s_addr = htonl(INADDR_ANY);
    }
}

std::string InetAddress::toIp() const {
    char buf[64] = "";
    ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof buf);
    return buf;
}

std::string InetAddress::toIpPort() const {
    char buf[64] = "";
    ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof buf);
    size_t end = std::strlen(buf);
    uint16_t port = ntohs(addr_.sin_port);
    std::snprintf(buf + end, sizeof buf - end, ":%u", port);
    return buf;
}

uint16_t InetAddress::toPort() const {
    return ntohs(addr_.sin_port);
}

bool InetAddress::SplitHostPort(const std::string& hostport, std::string* host, uint16_t* port) {
    const size_t colon = hostport.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= hostport.size()) return false;

    const std::string portStr = hostport.substr(colon + 1);
    if (portStr.size() > 5) return false;
    unsigned long value = 0;
    for (char c : portStr) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value == 0 || value > 65535) return false;

    *host = hostport.substr(0, colon);
    *port = static_cast<uint16_t>(value);
    return true;
}

bool InetAddress::ParseNumeric(const std::string& hostport, InetAddress* out) {
    std::string host;
    uint16_t port = 0;
    if (!SplitHostPort(hostport, &host, &port)) return false;

    struct sockaddr_in sin;
    std::memset(&sin, 0, sizeof sin);
    sin.sin_family = AF_INET;
    sin.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sin.sin_addr) != 1) return false;
    out->setSockAddr(sin);
    return true;
}

bool InetAddress::Resolve(const std::string& hostport, InetAddress* out, std::string* error) {
    if (ParseNumeric(hostport, out)) return true;

    std::string host;
    uint16_t port = 0;
    if (!SplitHostPort(hostport, &host, &port)) {
        *error = "invalid host:port '" + hostport + "'";
        return false;
    }

    struct sockaddr_in sin;
    std::memset(&sin, 0, sizeof sin);
    sin.sin_family = AF_INET;
    sin.sin_port = htons(port);

    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (gai != 0 || !res) {
        *error = "cannot resolve '" + host + "': " + ::gai_strerror(gai);
        if (res) ::freeaddrinfo(res);
        return false;
    }
    std::memcpy(&sin.sin_addr,
                &reinterpret_cast<const struct sockaddr_in*>(res->ai_addr)->sin_addr,
                sizeof sin.sin_addr);
    ::freeaddrinfo(res);
    out->setSockAddr(sin);
    return true;
}

} // namespace network
} // namespace lb
