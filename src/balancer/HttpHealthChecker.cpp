#include "lb/balancer/HttpHealthChecker.h"
#include "lb/network/Socket.h"
#include "lb/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace lb {
namespace balancer {

namespace {

const size_t kMaxStatusLineBytes = 8192;

} // namespace

HttpHealthChecker::HttpHealthChecker(lb::network::EventLoop* loop,
                                     double timeoutSec,
                                     std::shared_ptr<lb::network::Resolver> resolver)
    : HealthChecker(loop),
      timeoutSec_(timeoutSec),
      resolver_(resolver ? std::move(resolver) : std::make_shared<lb::network::Resolver>(1)) {
}

std::string HttpHealthChecker::BuildRequest(const Backend& backend) {
    return "GET " + backend.healthCheckPath + " HTTP/1.1\r\n"
           "Host: " + backend.address + "\r\n"
           "Connection: close\r\n"
           "\r\n";
}

void HttpHealthChecker::Check(const Backend& backend, CheckCallback cb) {
    auto self = shared_from_this();
    loop_->RunInLoop([self, backend, cb]() { self->Start(backend, cb); });
}

void HttpHealthChecker::Start(const Backend& backend, CheckCallback cb) {
    auto ctx = std::make_shared<CheckContext>();
    ctx->cb = std::move(cb);
    ctx->address = backend.address;
    ctx->out = BuildRequest(backend);

    // The timer and the lookup keep the checker alive until the check ends.
    auto self = shared_from_this();
    ctx->timer = loop_->RunAfter(timeoutSec_, [self, ctx] { self->OnTimeout(ctx); });
    if (ctx->timer == 0) {
        Finish(ctx, false);
        return;
    }

    resolver_->Resolve(loop_, backend.address,
        [self, ctx](bool ok, const lb::network::InetAddress& addr, const std::string& error) {
            if (ctx->finished) return;
            if (!ok) {
                LOG_DEBUG << "health check " << ctx->address << ": " << error;
                self->Finish(ctx, false);
                return;
            }
            self->Connect(ctx, addr);
        });
}

void HttpHealthChecker::Connect(const CheckContextPtr& ctx, const lb::network::InetAddress& addr) {
    const int sockfd = lb::network::Socket::CreateNonblocking();
    if (sockfd < 0) {
        Finish(ctx, false);
        return;
    }
    ctx->sockfd = sockfd;

    auto self = shared_from_this();
    ctx->connChannel = std::make_shared<lb::network::Channel>(loop_, sockfd);
    ctx->connChannel->SetWriteCallback([self, ctx]() { self->OnWritable(ctx); });
    ctx->connChannel->SetReadCallback([self, ctx](std::chrono::system_clock::time_point) { self->OnReadable(ctx); });
    ctx->connChannel->SetErrorCallback([self, ctx]() { self->Finish(ctx, false); });
    ctx->connChannel->SetCloseCallback([self, ctx]() { self->Finish(ctx, false); });

    const int ret = ::connect(sockfd, addr.getSockAddr(), sizeof(struct sockaddr_in));
    const int savedErrno = (ret == 0) ? 0 : errno;
    if (ret == 0 || savedErrno == EISCONN) {
        ctx->state = State::kSending;
        OnWritable(ctx);
    } else if (savedErrno == EINPROGRESS || savedErrno == EINTR) {
        ctx->state = State::kConnecting;
        ctx->connChannel->EnableWriting();
    } else {
        LOG_DEBUG << "health check " << ctx->address << " connect: " << std::strerror(savedErrno);
        Finish(ctx, false);
    }
}

void HttpHealthChecker::OnWritable(const CheckContextPtr& ctx) {
    if (ctx->finished) return;

    if (ctx->state == State::kConnecting) {
        const int err = lb::network::Socket::GetSocketError(ctx->sockfd);
        if (err) {
            LOG_DEBUG << "health check " << ctx->address << " connect: " << std::strerror(err);
            Finish(ctx, false);
            return;
        }
        ctx->state = State::kSending;
    }

    if (ctx->state == State::kSending) {
        while (ctx->outOffset < ctx->out.size()) {
            const char* p = ctx->out.data() + ctx->outOffset;
            const size_t left = ctx->out.size() - ctx->outOffset;
            const ssize_t n = ::send(ctx->sockfd, p, left, MSG_NOSIGNAL);
            if (n > 0) {
                ctx->outOffset += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                if (!ctx->connChannel->IsWriting()) ctx->connChannel->EnableWriting();
                return;
            }
            Finish(ctx, false);
            return;
        }

        ctx->connChannel->DisableWriting();
        ctx->state = State::kReading;
        ctx->connChannel->EnableReading();
    }
}

void HttpHealthChecker::OnReadable(const CheckContextPtr& ctx) {
    if (ctx->finished) return;

    char buf[4096];
    while (true) {
        const ssize_t n = ::recv(ctx->sockfd, buf, sizeof(buf), 0);
        if (n > 0) {
            ctx->in.append(buf, buf + n);
            const size_t pos = ctx->in.find('\n');
            if (pos != std::string::npos) {
                std::string line = ctx->in.substr(0, pos);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                const int code = ParseHttpStatusCode(line);
                Finish(ctx, code >= 200 && code <= 299);
                return;
            }
            if (ctx->in.size() > kMaxStatusLineBytes) {
                Finish(ctx, false);
                return;
            }
            continue;
        }
        if (n == 0) {
            // EOF before the status line
            Finish(ctx, false);
            return;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        if (errno == EINTR) continue;
        Finish(ctx, false);
        return;
    }
}

void HttpHealthChecker::OnTimeout(const CheckContextPtr& ctx) {
    ctx->timer = 0;
    if (!ctx->finished) {
        LOG_DEBUG << "health check " << ctx->address << " timed out after " << timeoutSec_ << "s";
    }
    Finish(ctx, false);
}

void HttpHealthChecker::Finish(const CheckContextPtr& ctx, bool healthy) {
    if (CleanUp(ctx)) {
        CheckCallback cb = std::move(ctx->cb);
        if (cb) cb(healthy);
    }
}

bool HttpHealthChecker::CleanUp(const CheckContextPtr& ctx) {
    if (ctx->finished) return false;
    ctx->finished = true;

    loop_->Cancel(ctx->timer);
    ctx->timer = 0;

    if (ctx->connChannel) {
        ctx->connChannel->Remove();
    }
    if (ctx->sockfd >= 0) {
        ::close(ctx->sockfd);
        ctx->sockfd = -1;
    }

    // We may be inside the channel's own callback; release it on the next
    // loop iteration. That also breaks the ctx <-> channel cycle.
    auto conn = std::move(ctx->connChannel);
    if (conn) loop_->QueueInLoop([conn]() {});
    return true;
}

int HttpHealthChecker::ParseHttpStatusCode(const std::string& line) {
    // Expected: HTTP/1.1 200 OK
    if (line.compare(0, 5, "HTTP/") != 0) return -1;
    const size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos) return -1;
    const size_t sp2 = line.find(' ', sp1 + 1);
    const std::string codeStr = (sp2 == std::string::npos) ? line.substr(sp1 + 1) : line.substr(sp1 + 1, sp2 - sp1 - 1);
    if (codeStr.size() != 3) return -1;
    int code = 0;
    for (char c : codeStr) {
        if (c < '0' || c > '9') return -1;
        code = code * 10 + (c - '0');
    }
    return code;
}

} // namespace balancer
} // namespace lb
