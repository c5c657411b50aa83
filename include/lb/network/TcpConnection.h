#pragma once

#include "lb/common/noncopyable.h"
#include "lb/network/Buffer.h"
#include "lb/network/Callbacks.h"
#include "lb/network/InetAddress.h"

#include <any>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace lb {
namespace network {

class Channel;
class EventLoop;
class Socket;

// A connected TCP stream owned by one EventLoop. Public mutators are thread
// safe; callbacks always run on the owning loop.
class TcpConnection : lb::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    // The peer has sent FIN; only meaningful with a half-close callback.
    bool peerClosed() const { return peerClosed_; }

    void SetContext(const std::any& context) { context_ = context; }
    std::any* GetMutableContext() { return &context_; }

    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    // Half-close: SHUT_WR once pending output is flushed. Reading goes on
    // until the peer closes its side.
    void Shutdown();
    // Stops reading, flushes pending output, sends FIN, then closes.
    void CloseAfterDrain();
    void ForceClose();
    void StartRead();
    void StopRead();

    bool IsReading() const { return reading_; }

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetHighWaterMarkCallback(const HighWaterMarkCallback& cb, size_t highWaterMark) {
        highWaterMarkCallback_ = cb;
        highWaterMark_ = highWaterMark;
    }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }
    // Without one, a FIN from the peer closes the connection. With one, reads
    // stop, the callback runs and the write side stays open until the owner
    // closes it.
    void SetHalfCloseCallback(const HalfCloseCallback& cb) { halfCloseCallback_ = cb; }

    // Called once the connection is handed to its loop.
    void ConnectEstablished();
    // Called after the owner has dropped the connection.
    void ConnectDestroyed();

private:
    enum StateE { kDisconnected, kConnecting, kConnected, kDisconnecting };

    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const void* data, size_t len);
    void ShutdownInLoop();
    void CloseAfterDrainInLoop();
    void ForceCloseInLoop();
    void StartReadInLoop();
    void StopReadInLoop();
    void OnOutputDrained();

    void SetState(StateE s) { state_ = s; }
    static const char* StateToString(StateE s);

    EventLoop* loop_;
    const std::string name_;
    std::atomic<StateE> state_;
    bool reading_;
    bool closeAfterDrain_;
    bool peerClosed_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    HighWaterMarkCallback highWaterMarkCallback_;
    CloseCallback closeCallback_;
    HalfCloseCallback halfCloseCallback_;

    size_t highWaterMark_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;
};

} // namespace network
} // namespace lb
