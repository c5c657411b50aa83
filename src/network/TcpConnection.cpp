#include "lb/network/TcpConnection.h"
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

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& nameArg,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr)
    : loop_(loop),
      name_(nameArg),
      state_(kConnecting),
      reading_(true),
      closeAfterDrain_(false),
      peerClosed_(false),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      highWaterMark_(64 * 1024 * 1024) {
    channel_->SetReadCallback(
        [this](std::chrono::system_clock::time_point receiveTime) { HandleRead(receiveTime); });
    channel_->SetWriteCallback([this] { HandleWrite(); });
    channel_->SetCloseCallback([this] { HandleClose(); });
    channel_->SetErrorCallback([this] { HandleError(); });

    LOG_DEBUG << "TcpConnection::ctor[" << name_ << "] at " << this << " fd=" << sockfd;
    socket_->SetKeepAlive(true);
    socket_->SetTcpNoDelay(true);
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection::dtor[" << name_ << "] at " << this
              << " fd=" << channel_->fd() << " state=" << StateToString(state_);
}

const char* TcpConnection::StateToString(StateE s) {
    switch (s) {
        case kDisconnected: return "kDisconnected";
        case kConnecting: return "kConnecting";
        case kConnected: return "kConnected";
        case kDisconnecting: return "kDisconnecting";
        default: return "unknown";
    }
}

void TcpConnection::ConnectEstablished() {
    SetState(kConnected);
    channel_->Tie(shared_from_this());
    channel_->EnableReading();

    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == kConnected || state_ == kDisconnecting) {
        SetState(kDisconnected);
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    if (state_ == kDisconnected) return;

    int savedErrno = 0;
    const ssize_t n = inputBuffer_.ReadFd(channel_->fd(), &savedErrno);
    if (n > 0) {
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
    } else if (n == 0) {
        if (halfCloseCallback_ && !peerClosed_) {
            peerClosed_ = true;
            StopReadInLoop();
            halfCloseCallback_(shared_from_this());
        } else {
            HandleClose();
        }
    } else {
        if (savedErrno == EAGAIN || savedErrno == EWOULDBLOCK || savedErrno == EINTR) return;
        LOG_WARN << "TcpConnection::HandleRead [" << name_ << "] " << std::strerror(savedErrno);
        HandleClose();
    }
}

void TcpConnection::HandleWrite() {
    if (!channel_->IsWriting()) {
        LOG_DEBUG << "Connection fd = " << channel_->fd() << " is down, no more writing";
        return;
    }

    const ssize_t n = ::write(channel_->fd(), outputBuffer_.Peek(), outputBuffer_.ReadableBytes());
    if (n > 0) {
        outputBuffer_.Retrieve(n);
        if (outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
            OnOutputDrained();
        }
    } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        LOG_WARN << "TcpConnection::HandleWrite [" << name_ << "] " << std::strerror(errno);
        HandleClose();
    }
}

void TcpConnection::OnOutputDrained() {
    if (writeCompleteCallback_) {
        loop_->QueueInLoop([self = shared_from_this()] {
            if (self->writeCompleteCallback_) self->writeCompleteCallback_(self);
        });
    }
    if (state_ == kDisconnecting) {
        if (closeAfterDrain_) {
            socket_->ShutdownWrite();
            HandleClose();
        } else {
            ShutdownInLoop();
        }
    }
}

void TcpConnection::HandleClose() {
    if (state_ == kDisconnected) return;
    LOG_DEBUG << "fd = " << channel_->fd() << " state = " << StateToString(state_);
    SetState(kDisconnected);
    reading_ = false;
    channel_->DisableAll();

    TcpConnectionPtr guardThis(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guardThis);
    }
    if (closeCallback_) {
        closeCallback_(guardThis);
    }
}

void TcpConnection::HandleError() {
    const int err = Socket::GetSocketError(channel_->fd());
    LOG_WARN << "TcpConnection::HandleError [" << name_ << "] SO_ERROR=" << err << " " << std::strerror(err);
    HandleClose();
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ != kConnected) return;
    if (loop_->IsInLoopThread()) {
        SendInLoop(data, len);
    } else {
        std::string msg(static_cast<const char*>(data), len);
        loop_->RunInLoop([ptr = shared_from_this(), msg = std::move(msg)]() {
            ptr->SendInLoop(msg.data(), msg.size());
        });
    }
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    ssize_t nwrote = 0;
    size_t remaining = len;

    if (state_ == kDisconnected) {
        LOG_DEBUG << "disconnected, give up writing";
        return;
    }

    // Nothing queued: try writing directly.
    if (!channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        nwrote = ::write(channel_->fd(), data, len);
        if (nwrote >= 0) {
            remaining = len - nwrote;
            if (remaining == 0) {
                OnOutputDrained();
            }
        } else {
            nwrote = 0;
            if (errno != EWOULDBLOCK && errno != EAGAIN && errno != EINTR) {
                LOG_WARN << "TcpConnection::SendInLoop [" << name_ << "] " << std::strerror(errno);
                loop_->QueueInLoop([self = shared_from_this()] { self->ForceCloseInLoop(); });
                return;
            }
        }
    }

    if (remaining > 0) {
        const size_t oldLen = outputBuffer_.ReadableBytes();
        if (oldLen + remaining >= highWaterMark_
            && oldLen < highWaterMark_
            && highWaterMarkCallback_) {
            const size_t total = oldLen + remaining;
            loop_->QueueInLoop([self = shared_from_this(), total] {
                if (self->highWaterMarkCallback_) self->highWaterMarkCallback_(self, total);
            });
        }
        outputBuffer_.Append(static_cast<const char*>(data) + nwrote, remaining);
        if (!channel_->IsWriting()) {
            channel_->EnableWriting();
        }
    }
}

void TcpConnection::Shutdown() {
    if (state_ == kConnected) {
        SetState(kDisconnecting);
        loop_->RunInLoop([self = shared_from_this()] { self->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    if (!channel_->IsWriting()) {
        socket_->ShutdownWrite();
    }
}

void TcpConnection::CloseAfterDrain() {
    if (state_ == kConnected || state_ == kDisconnecting) {
        loop_->RunInLoop([self = shared_from_this()] { self->CloseAfterDrainInLoop(); });
    }
}

void TcpConnection::CloseAfterDrainInLoop() {
    if (state_ == kDisconnected) return;
    SetState(kDisconnecting);
    closeAfterDrain_ = true;
    StopReadInLoop();
    if (!channel_->IsWriting()) {
        socket_->ShutdownWrite();
        HandleClose();
    }
}

void TcpConnection::ForceClose() {
    if (state_ == kConnected || state_ == kDisconnecting) {
        loop_->RunInLoop([self = shared_from_this()] { self->ForceCloseInLoop(); });
    }
}

void TcpConnection::ForceCloseInLoop() {
    if (state_ == kConnected || state_ == kDisconnecting) {
        HandleClose();
    }
}

void TcpConnection::StartRead() {
    loop_->RunInLoop([self = shared_from_this()] { self->StartReadInLoop(); });
}

void TcpConnection::StopRead() {
    loop_->RunInLoop([self = shared_from_this()] { self->StopReadInLoop(); });
}

void TcpConnection::StartReadInLoop() {
    // A Shutdown() connection keeps reading; CloseAfterDrain and a peer FIN
    // end reading for good.
    if (reading_ || peerClosed_ || closeAfterDrain_) return;
    if (state_ == kConnected || state_ == kDisconnecting) {
        reading_ = true;
        channel_->EnableReading();
    }
}

void TcpConnection::StopReadInLoop() {
    if (reading_) {
        reading_ = false;
        channel_->DisableReading();
    }
}

} // namespace network
} // namespace lb
