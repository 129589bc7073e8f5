#pragma once

#include <functional>
#include <memory>

#include "Callbacks.h"
#include "NonCopyable.h"
#include "Timestamp.h"

class EventLoop;

/**
 * Channel：封装 fd 与其感兴趣的事件（EPOLLIN/EPOLLOUT 等）
 * 以及 poller 返回的具体事件，不拥有 fd，仅负责事件分发
 */
class Channel : NonCopyable {
public:
    Channel(EventLoop* loop, int fd);
    ~Channel();

    // fd 得到 poller 通知以后，处理事件
    void handleEvent(Timestamp receiveTime);

    void setReadCallback(ReadEventCallback cb) { readCallback_ = std::move(cb); }
    void setWriteCallback(EventCallback cb) { writeCallback_ = std::move(cb); }
    void setCloseCallback(EventCallback cb) { closeCallback_ = std::move(cb); }
    void setErrorCallback(EventCallback cb) { errorCallback_ = std::move(cb); }

    // 防止 channel 被手动 remove 后，仍在执行回调
    void tie(const std::shared_ptr<void>& obj);

    int getFd() const { return fd_; }
    int getEvents() const { return events_; }
    void setRevents(int revt) { revents_ = revt; }

    // 设置 fd 相应的事件状态
    void enableReading() {
        events_ |= kReadEvent;
        update();
    }
    void disableReading() {
        events_ &= ~kReadEvent;
        update();
    }
    void enableWriting() {
        events_ |= kWriteEvent;
        update();
    }
    void disableWriting() {
        events_ &= ~kWriteEvent;
        update();
    }
    void disableAll() {
        events_ = kNoneEvent;
        update();
    }

    bool isNoneEvent() const { return events_ == kNoneEvent; }
    bool isWriting() const { return events_ & kWriteEvent; }
    bool isReading() const { return events_ & kReadEvent; }

    int getIndex() const { return index_; }
    void setIndex(int idx) { index_ = idx; }

    EventLoop* ownerLoop() { return loop_; }
    void remove();

private:
    void update();
    void handleEventWithGuard(Timestamp receiveTime);

    static const int kNoneEvent;
    static const int kReadEvent;
    static const int kWriteEvent;

    EventLoop* loop_;  // 事件循环
    const int fd_;  // Poller 监听的对象
    int events_;  // 注册 fd 感兴趣的事件
    int revents_;  // poller 返回的具体发生的事件
    int index_;

    std::weak_ptr<void> tie_;
    bool tied_;

    ReadEventCallback readCallback_;
    EventCallback writeCallback_;
    EventCallback closeCallback_;
    EventCallback errorCallback_;
};
