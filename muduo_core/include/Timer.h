#pragma once

#include <atomic>
#include <cstdint>

#include "Callbacks.h"
#include "NonCopyable.h"
#include "Timestamp.h"

// 定时器：到期时间 + 回调 + 可选的重复间隔
class Timer : NonCopyable {
public:
    Timer(TimerCallback cb, Timestamp when, double interval) :
        callback_(std::move(cb)), expiration_(when), interval_(interval), repeat_(interval > 0.0), sequence_(s_numCreated_.fetch_add(1) + 1) {}

    void run() const { callback_(); }

    Timestamp expiration() const { return expiration_; }
    bool repeat() const { return repeat_; }
    int64_t sequence() const { return sequence_; }

    // 重复定时器：以 now 为基准重新计算下一次到期时间
    void restart(Timestamp now) { expiration_ = repeat_ ? addTime(now, interval_) : Timestamp(); }

private:
    const TimerCallback callback_;
    Timestamp expiration_;
    const double interval_;
    const bool repeat_;
    const int64_t sequence_;

    static inline std::atomic<int64_t> s_numCreated_{0};
};

// 对外暴露的定时器句柄，仅用于 cancel
class TimerId {
public:
    TimerId() = default;
    TimerId(Timer* timer, int64_t seq) : timer_(timer), sequence_(seq) {}

    bool valid() const { return timer_ != nullptr; }

private:
    friend class TimerQueue;

    Timer* timer_{nullptr};
    int64_t sequence_{0};
};
