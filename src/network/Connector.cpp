#include "lb/network/Connector.h"
#include "lb/network/Channel.h"
#include "lb/network/EventLoop.h"
#include "lb/network/Socket.h"
#include "lb/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace lb {
namespace network {

Connector::Connector(EventLoop* loop, const InetAddress& serverAddr, double timeoutSeconds)
    : loop_(loop),
      serverAddr_(serverAddr),
      timeoutSeconds_(timeoutSeconds),
      state_(kDisconnected),
      timeoutTimer_(0) {
}

Connector::~Connector() = default;

void Connector::Start() {
    loop_->RunInLoop([self = shared_from_this()] { self->StartInLoop(); });
}

void Connector::Stop() {
    loop_->RunInLoop([self = shared_from_this()] { self->StopInLoop(); });
}

void Connector::StartInLoop() {
    if (state_ != kDisconnected) return;

    int sockfd = Socket::CreateNonblocking();
    if (sockfd < 0) {
        const int err = errno;
        if (failureCallback_) failureCallback_(err);
        return;
    }

    const int ret = ::connect(sockfd, serverAddr_.getSockAddr(), sizeof(struct sockaddr_in));
    const int savedErrno = (ret == 0) ? 0 : errno;

    switch (savedErrno) {
        case 0:
        case EINPROGRESS:
        case EINTR:
        case EISCONN:
            Connecting(sockfd);
            break;

        default:
            LOG_DEBUG << "connect " << serverAddr_.toIpPort() << ": " << std::strerror(savedErrno);
            Fail(sockfd, savedErrno);
            break;
    }
}

void Connector::StopInLoop() {
    loop_->Cancel(timeoutTimer_);
    if (state_ == kConnecting) {
        int sockfd = RemoveAndResetChannel();
        ::close(sockfd);
    }
    state_ = kDisconnected;
    newConnectionCallback_ = nullptr;
    failureCallback_ = nullptr;
}

void Connector::Connecting(int sockfd) {
    state_ = kConnecting;
    channel_.reset(new Channel(loop_, sockfd));
    channel_->SetWriteCallback([this] { HandleWrite(); });
    channel_->SetErrorCallback([this] { HandleError(); });
    channel_->Tie(shared_from_this());
    channel_->EnableWriting();

    if (timeoutSeconds_ > 0) {
        std::weak_ptr<Connector> weakSelf = shared_from_this();
        timeoutTimer_ = loop_->RunAfter(timeoutSeconds_, [weakSelf] {
            if (auto self = weakSelf.lock()) self->HandleTimeout();
        });
        if (timeoutTimer_ == 0) {
            LOG_WARN << "connect timeout to " << serverAddr_.toIpPort() << " not armed";
        }
    }
}

int Connector::RemoveAndResetChannel() {
    channel_->DisableAll();
    channel_->Remove();
    const int sockfd = channel_->fd();
    // Still inside Channel::HandleEvent; release the channel afterwards.
    Channel* ch = channel_.release();
    loop_->QueueInLoop([ch] { delete ch; });
    return sockfd;
}

void Connector::HandleWrite() {
    if (state_ != kConnecting) return;

    loop_->Cancel(timeoutTimer_);
    int sockfd = RemoveAndResetChannel();
    const int err = Socket::GetSocketError(sockfd);
    if (err) {
        LOG_DEBUG << "connect " << serverAddr_.toIpPort() << " SO_ERROR=" << err << " " << std::strerror(err);
        Fail(sockfd, err);
        return;
    }

    state_ = kConnected;
    if (newConnectionCallback_) {
        newConnectionCallback_(sockfd);
    } else {
        ::close(sockfd);
    }
}

void Connector::HandleError() {
    if (state_ != kConnecting) return;

    loop_->Cancel(timeoutTimer_);
    int sockfd = RemoveAndResetChannel();
    int err = Socket::GetSocketError(sockfd);
    if (err == 0) err = ECONNREFUSED;
    Fail(sockfd, err);
}

void Connector::HandleTimeout() {
    if (state_ != kConnecting) return;

    loop_->Cancel(timeoutTimer_);
    int sockfd = RemoveAndResetChannel();
    Fail(sockfd, ETIMEDOUT);
}

void Connector::Fail(int sockfd, int err) {
    ::close(sockfd);
    state_ = kDisconnected;
    if (failureCallback_) failureCallback_(err);
}

} // namespace network
} // namespace lb
