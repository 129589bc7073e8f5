#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "Callbacks.h"
#include "CurrentThread.h"
#include "NonCopyable.h"
#include "Timer.h"
#include "Timestamp.h"

class Channel;
class Poller;
class TimerQueue;

// 事件循环类：主要包含两个大模块 Channel 与 Poller（epoll 的抽象），外加定时器队列
class EventLoop : NonCopyable {
public:
    using Functor = std::function<void()>;

    EventLoop();
    ~EventLoop();

    // 开启事件循环
    void loop();
    // 退出事件循环
    void quit();

    Timestamp pollReturnTime() const { return pollReturnTime_; }

    // 在当前 loop 中执行
    void runInLoop(Functor cb);
    // 把上层注册的回调函数 cb 放入队列中，唤醒 loop 所在的线程执行 cb
    void queueInLoop(Functor cb);

    // ========== 定时器（线程安全） ==========
    TimerId runAt(Timestamp time, TimerCallback cb);
    TimerId runAfter(double delaySeconds, TimerCallback cb);
    TimerId runEvery(double intervalSeconds, TimerCallback cb);
    void cancel(TimerId timerId);

    // 通过 eventfd 唤醒 loop 所在的线程
    void wakeup();

    // EventLoop 的方法 => Poller 的方法
    void updateChannel(Channel* channel);
    void removeChannel(Channel* channel);
    bool hasChannel(Channel* channel);

    // 判断 EventLoop 对象是否在自己的线程里
    bool isInLoopThread() const { return threadId_ == CurrentThread::tid(); }

private:
    // 给 eventfd 返回的文件描述符 wakeupFd_ 绑定的事件回调
    void handleRead();
    // 执行上层回调
    void doPendingFunctors();

    using ChannelList = std::vector<Channel*>;

    std::atomic_bool looping_;
    std::atomic_bool quit_;

    const int threadId_;  // 记录当前 EventLoop 是被哪个线程 id 创建的

    Timestamp pollReturnTime_;
    std::unique_ptr<Poller> poller_;
    std::unique_ptr<TimerQueue> timerQueue_;

    int wakeupFd_;  // mainLoop 获取新 channel 后，通过该 fd 唤醒 subLoop
    std::unique_ptr<Channel> wakeupChannel_;

    ChannelList activeChannels_;

    std::atomic_bool callingPendingFunctors_;  // 标识当前 loop 是否有需要执行的回调操作
    std::vector<Functor> pendingFunctors_;  // 存储 loop 需要执行的所有回调操作
    std::mutex mutex_;  // 保护 pendingFunctors_ 的线程安全操作
};
