#pragma once
#include <openssl/ssl.h>  // 必须：提供 SSL/SSL_CTX
#include <amqpcpp.h>
#include <amqpcpp/linux_tcp/tcpparent.h>  // 先于 tcpconnection
#include <amqpcpp/linux_tcp/tcphandler.h>
#include <amqpcpp/linux_tcp/tcpconnection.h>
#include <amqpcpp/linux_tcp/tcpchannel.h>

#include <atomic>
#include <cstdint>
#include <memory>

#include "Channel.h"
#include "EventLoop.h"
#include "LogMacros.h"
#include "Timer.h"

/**
 * @brief MQHandler：把 AMQP-CPP 的 TcpHandler 事件对接到 EventLoop / Channel
 *
 * 所有回调都在 loop 线程中触发。连接建立后按协商的心跳间隔的一半发送心跳，
 * 否则 broker 会在空闲约三个心跳周期后断开连接。
 */
class MQHandler : public AMQP::TcpHandler {
public:
    enum class State : std::uint8_t { kConnecting, kReady, kClosed };

    explicit MQHandler(EventLoop* loop) : loop_(loop) {}

    // 进入关闭态并释放 Channel；可重复调用
    void unregister() {
        state_.store(State::kClosed, std::memory_order_release);
        if (closed_.exchange(true))
            return;

        if (heartbeatTimer_.valid()) {
            loop_->cancel(heartbeatTimer_);
            heartbeatTimer_ = TimerId();
        }

        Channel* ch = channel_.release();  // 必须由 loop 线程销毁
        if (!ch)
            return;
        connFd_ = -1;
        loop_->queueInLoop([ch]() {
            // 不调用 disableAll()：fd 可能已被库关闭，EPOLL_CTL_DEL 会报 EBADF
            ch->remove();
            delete ch;
        });
    }

    void monitor(AMQP::TcpConnection* connection, int fd, int flags) override {
        // flags == 0 表示连接即将或已经关闭
        if (flags == 0) {
            unregister();
            return;
        }
        if (closed_.load(std::memory_order_acquire))
            return;

        if (!channel_) {
            connFd_ = fd;
            channel_ = std::make_unique<Channel>(loop_, fd);
            // process() 内部可能再次回调 monitor()
            channel_->setReadCallback([this, connection](Timestamp) {
                if (!closed_.load(std::memory_order_acquire))
                    connection->process(connFd_, AMQP::readable);
            });
            channel_->setWriteCallback([this, connection] {
                if (!closed_.load(std::memory_order_acquire))
                    connection->process(connFd_, AMQP::writable);
            });
        }

        if (flags & AMQP::readable)
            channel_->enableReading();
        else
            channel_->disableReading();
        if (flags & AMQP::writable)
            channel_->enableWriting();
        else
            channel_->disableWriting();
    }

    uint16_t onNegotiate(AMQP::TcpConnection* connection, uint16_t interval) override {
        if (interval == 0 || closed_.load(std::memory_order_acquire))
            return interval;
        const double period = interval / 2.0;
        heartbeatTimer_ = loop_->runEvery(period, [this, connection] {
            if (state_.load(std::memory_order_acquire) == State::kReady)
                connection->heartbeat();
        });
        LOG_DEBUG("[MQ] Heartbeat negotiated: {}s, sending every {}s", interval, period);
        return interval;
    }

    void onConnected(AMQP::TcpConnection*) override { LOG_INFO("[MQ] TCP connection to broker established."); }

    void onReady(AMQP::TcpConnection*) override {
        state_.store(State::kReady, std::memory_order_release);
        LOG_INFO("[MQ] AMQP login completed, channel ready.");
    }

    void onError(AMQP::TcpConnection*, const char* msg) override {
        state_.store(State::kClosed, std::memory_order_release);
        LOG_ERROR("[MQ] Connection error: {}", msg);
    }

    void onClosed(AMQP::TcpConnection*) override {
        state_.store(State::kClosed, std::memory_order_release);
        LOG_INFO("[MQ] Connection closed.");
    }

    // 已完成登录且未断开；发布方据此决定是否丢弃消息
    bool ready() const noexcept { return state_.load(std::memory_order_acquire) == State::kReady; }
    State state() const noexcept { return state_.load(std::memory_order_acquire); }

private:
    EventLoop* loop_{nullptr};
    std::unique_ptr<Channel> channel_;
    int connFd_{-1};
    TimerId heartbeatTimer_;

    std::atomic<State> state_{State::kConnecting};
    std::atomic<bool> closed_{false};  // 关闭后不再触碰 fd / channel
};
