#pragma once

#include <memory>
#include <set>
#include <utility>
#include <vector>

#include "Callbacks.h"
#include "Channel.h"
#include "NonCopyable.h"
#include "Timer.h"
#include "Timestamp.h"

class EventLoop;

/**
 * TimerQueue：基于 timerfd 的定时器队列
 * 所有定时器共享一个 timerfd，始终把 timerfd 设为最早到期的定时器时间
 * 只在所属 loop 线程中修改，跨线程调用通过 runInLoop 转发
 */
class TimerQueue : NonCopyable {
public:
    explicit TimerQueue(EventLoop* loop);
    ~TimerQueue();

    // 线程安全
    TimerId addTimer(TimerCallback cb, Timestamp when, double interval);
    void cancel(TimerId timerId);

private:
    using Entry = std::pair<Timestamp, Timer*>;
    using TimerList = std::set<Entry>;
    using ActiveTimer = std::pair<Timer*, int64_t>;
    using ActiveTimerSet = std::set<ActiveTimer>;

    void addTimerInLoop(Timer* timer);
    void cancelInLoop(TimerId timerId);
    // timerfd 可读时的回调
    void handleRead();
    // 取出所有到期的定时器
    std::vector<Entry> getExpired(Timestamp now);
    void reset(const std::vector<Entry>& expired, Timestamp now);
    bool insert(Timer* timer);

    EventLoop* loop_;
    const int timerfd_;
    Channel timerfdChannel_;

    TimerList timers_;  // 按到期时间排序
    ActiveTimerSet activeTimers_;  // 按对象地址排序，用于 cancel
    bool callingExpiredTimers_{false};
    ActiveTimerSet cancelingTimers_;
};
