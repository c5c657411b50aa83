#include "lb/LoadBalancerServer.h"
#include "lb/ServerOptions.h"
#include "lb/common/Logger.h"
#include "lb/monitor/Stats.h"
#include "lb/network/EventLoop.h"
#include "lb/protocol/HttpResponse.h"

#include <arpa/inet.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using lb::network::EventLoop;

namespace {

static bool pollReadable(int fd, int timeoutMs) {
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    return ::poll(&pfd, 1, timeoutMs) == 1;
}

static bool sendAll(int fd, const std::string& s) {
    size_t off = 0;
    while (off < s.size()) {
        ssize_t n = ::send(fd, s.data() + off, s.size() - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += static_cast<size_t>(n);
    }
    return true;
}

static int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

static std::optional<uint16_t> bindEphemeralTcpPort(int* listenFdOut) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return std::nullopt;
    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(0);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd, 64) != 0) {
        ::close(fd);
        return std::nullopt;
    }
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        ::close(fd);
        return std::nullopt;
    }
    *listenFdOut = fd;
    return ntohs(addr.sin_port);
}

// Reads until `want` bytes arrived, the peer closed, or a read stalls.
static std::string recvExactly(int fd, size_t want, int timeoutMs) {
    std::string out;
    char buf[65536];
    while (out.size() < want) {
        if (!pollReadable(fd, timeoutMs)) break;
        ssize_t n = ::recv(fd, buf, std::min(sizeof(buf), want - out.size()), 0);
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

static std::string recvUntilClose(int fd, int timeoutMs) {
    std::string out;
    char buf[4096];
    while (pollReadable(fd, timeoutMs)) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

// Answers "GET /health" with 200 and otherwise prefixes its name to an echo
// of everything it receives. Closes once the peer has finished sending.
class TaggedEchoBackend {
public:
    explicit TaggedEchoBackend(const std::string& tag) : tag_(tag) {
        auto port = bindEphemeralTcpPort(&listenFd_);
        assert(port.has_value());
        port_ = *port;
        acceptThread_ = std::thread([this]() { AcceptLoop(); });
    }

    ~TaggedEchoBackend() {
        stop_ = true;
        acceptThread_.join();
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& t : workers_) t.join();
    }

    std::string address() const { return "127.0.0.1:" + std::to_string(port_); }
    int proxiedConnections() const { return proxied_.load(); }
    // Connections that ended before sending a single byte.
    int emptyStreams() const { return emptyStreams_.load(); }

private:
    void AcceptLoop() {
        while (!stop_) {
            if (!pollReadable(listenFd_, 100)) continue;
            int cfd = ::accept(listenFd_, nullptr, nullptr);
            if (cfd < 0) continue;
            std::lock_guard<std::mutex> lock(mutex_);
            workers_.emplace_back([this, cfd]() { Serve(cfd); });
        }
        ::close(listenFd_);
    }

    void Serve(int cfd) {
        bool first = true;
        char buf[65536];
        while (!stop_) {
            if (!pollReadable(cfd, 100)) continue;
            ssize_t n = ::recv(cfd, buf, sizeof(buf), 0);
            if (n <= 0) {
                if (n == 0 && first) emptyStreams_++;
                break;
            }
            std::string chunk(buf, static_cast<size_t>(n));
            if (first) {
                first = false;
                if (chunk.compare(0, 11, "GET /health") == 0) {
                    sendAll(cfd, "HTTP/1.1 200 OK\r\nContent-Length: 2\r\nConnection: close\r\n\r\nok");
                    break;
                }
                proxied_++;
                chunk = tag_ + "|" + chunk;
            }
            if (!sendAll(cfd, chunk)) break;
        }
        ::close(cfd);
    }

    std::string tag_;
    int listenFd_{-1};
    uint16_t port_{0};
    std::atomic<bool> stop_{false};
    std::atomic<int> proxied_{0};
    std::atomic<int> emptyStreams_{0};
    std::thread acceptThread_;
    std::mutex mutex_;
    std::vector<std::thread> workers_;
};

std::atomic<int> failures{0};

void Expect(bool cond, const std::string& what) {
    if (!cond) {
        LOG_ERROR << "FAILED: " << what;
        failures++;
    }
}

// One request over a fresh connection; returns the backend tag that answered.
std::string RoundTrip(uint16_t port, const std::string& request) {
    int fd = connectTo(port);
    if (fd < 0) return "<connect failed>";
    sendAll(fd, request);
    std::string reply = recvExactly(fd, 2 + request.size(), 2000);
    ::close(fd);
    const size_t bar = reply.find('|');
    if (bar == std::string::npos || reply.substr(bar + 1) != request) return "<bad reply>";
    return reply.substr(0, bar);
}

// A large binary payload sent in several writes after the first chunk comes
// back byte for byte from the backend named `tag`.
void BulkTransfer(uint16_t port, const std::string& requestLine, const std::string& tag) {
    int fd = connectTo(port);
    Expect(fd >= 0, "connect for bulk transfer " + requestLine);
    if (fd < 0) return;
    std::string payload = requestLine + "\r\n\r\n";
    std::string body(4 * 1024 * 1024, '\0');
    for (size_t i = 0; i < body.size(); ++i) body[i] = static_cast<char>((i * 131) & 0xff);
    payload += body;

    std::thread writer([fd, &payload]() {
        const size_t step = 100000;
        for (size_t off = 0; off < payload.size(); off += step) {
            if (!sendAll(fd, payload.substr(off, step))) return;
        }
    });
    std::string reply = recvExactly(fd, 2 + payload.size(), 3000);
    writer.join();
    ::close(fd);
    Expect(reply.size() == 2 + payload.size(), "bulk reply size for " + requestLine);
    if (tag.empty()) {
        Expect(reply.compare(0, 2, "A|") == 0 || reply.compare(0, 2, "B|") == 0,
               "bulk round robin tag for " + requestLine);
    } else {
        Expect(reply.compare(0, 2, tag + "|") == 0, "bulk tag " + tag + " for " + requestLine);
    }
    Expect(reply.compare(2, std::string::npos, payload) == 0, "bulk reply bytes for " + requestLine);
}

void RunRelayClient(uint16_t port, TaggedEchoBackend* a, TaggedEchoBackend* b) {
    const std::string get = "GET / HTTP/1.1\r\nHost: lb\r\n\r\n";

    // Round robin over A and B; C is reserved for /api.
    std::vector<std::string> order;
    for (int i = 0; i < 4; ++i) order.push_back(RoundTrip(port, get));
    Expect((order == std::vector<std::string>{"A", "B", "A", "B"}), "round robin A,B,A,B");

    Expect(RoundTrip(port, "GET /api/x HTTP/1.1\r\n\r\n") == "C", "path route to C");
    Expect(RoundTrip(port, "GET /apix HTTP/1.1\r\n\r\n") == "C", "literal prefix match");

    // Non-HTTP first chunk still routes by its second token.
    Expect(RoundTrip(port, "HELLO /api binary") == "C", "non-HTTP bytes routed");

    BulkTransfer(port, "PUT /upload HTTP/1.1", "");
    BulkTransfer(port, "PUT /api/upload HTTP/1.1", "C");

    // Half-close after the request: the full reply still arrives, then the
    // backend's close is passed on.
    {
        const std::string req = "GET /api/half HTTP/1.1\r\n\r\n";
        int fd = connectTo(port);
        sendAll(fd, req);
        ::shutdown(fd, SHUT_WR);
        Expect(recvUntilClose(fd, 2000) == "C|" + req, "reply after client half-close");
        ::close(fd);
    }

    // Client goes away after the first chunk; the proxy must stay healthy.
    {
        int fd = connectTo(port);
        sendAll(fd, get);
        ::close(fd);
    }

    // Nothing sent at all: routed as "/" and the backend sees an empty stream.
    {
        const int emptyBefore = a->emptyStreams() + b->emptyStreams();
        int fd = connectTo(port);
        ::shutdown(fd, SHUT_WR);
        Expect(recvUntilClose(fd, 2000).empty(), "empty stream gets an empty reply");
        ::close(fd);
        Expect(a->emptyStreams() + b->emptyStreams() >= emptyBefore + 1,
               "empty stream reached a round robin backend");
    }

    Expect(RoundTrip(port, get) != "<bad reply>", "still serving after aborted clients");
}

void RunUnavailableClient(uint16_t port) {
    int fd = connectTo(port);
    Expect(fd >= 0, "connect to empty balancer");
    sendAll(fd, "GET / HTTP/1.1\r\nHost: lb\r\n\r\n");
    const std::string reply = recvUntilClose(fd, 2000);
    ::close(fd);
    Expect(reply == lb::protocol::ServiceUnavailableResponse(), "exact 503 reply then close");
    Expect(reply == "HTTP/1.1 503 Service Unavailable\r\nContent-Length: 20\r\n\r\nService Unavailable\n",
           "503 wire bytes");

    // FIN before any byte is routed too, and still gets the 503.
    fd = connectTo(port);
    Expect(fd >= 0, "connect to empty balancer for FIN");
    ::shutdown(fd, SHUT_WR);
    Expect(recvUntilClose(fd, 2000) == lb::protocol::ServiceUnavailableResponse(),
           "503 after FIN before data");
    ::close(fd);
}

} // namespace

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    lb::common::Logger::Instance().SetLevel(lb::common::LogLevel::WARN);

    TaggedEchoBackend a("A"), b("B"), c("C");

    lb::ServerOptions options;
    options.listenPort = 0;
    options.threads = 2;
    options.healthCheckIntervalSec = 0.2;
    options.healthCheckTimeoutSec = 0.5;
    options.highWaterMarkBytes = 64 * 1024;
    options.backends = {{a.address(), "/health"}, {b.address(), "/health"}, {c.address(), "/health"}};
    options.routes = {{"/api", c.address()}};

    EventLoop loop;
    lb::LoadBalancerServer server(&loop, options, nullptr, "RelayTest");
    assert(server.Start());
    const uint16_t port = server.listenAddress().toPort();

    lb::ServerOptions emptyOptions;
    emptyOptions.listenPort = 0;
    lb::LoadBalancerServer empty(&loop, emptyOptions, nullptr, "EmptyTest");
    assert(empty.Start());
    const uint16_t emptyPort = empty.listenAddress().toPort();

    auto& stats = lb::monitor::Stats::Instance();
    const long unavailableBefore = stats.GetUnavailable();

    std::thread client([&]() {
        RunRelayClient(port, &a, &b);
        RunUnavailableClient(emptyPort);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();

    Expect(stats.GetUnavailable() == unavailableBefore + 2, "unavailable counted");
    Expect(stats.GetPathRouted() >= 5, "path routes counted");
    Expect(c.proxiedConnections() >= 5, "C saw only path-routed traffic");

    if (failures != 0) {
        LOG_ERROR << "ProxyRelay: FAIL";
        return 1;
    }
    LOG_INFO << "ProxyRelay: PASS";
    return 0;
}
