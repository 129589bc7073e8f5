#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

#include "NonCopyable.h"
#include "Timer.h"
#include "domain/InventoryDomainService.h"

class EventLoop;
class EventLoopThread;

/**
 * @brief ExpirationSweeper：过期预留清理定时任务
 *
 * 在独立的 EventLoopThread 上以 runEvery 周期调用 CleanupExpiredReservations()。
 * 同一个 sweeper 上一轮未结束时，新的触发直接跳过；
 * 不同进程/线程并发清理是安全的，过期路径会在行锁下重新确认 ACTIVE。
 */
class ExpirationSweeper : NonCopyable {
public:
    using SweepReport = InventoryDomainService::SweepReport;

    struct Options {
        std::chrono::milliseconds interval{std::chrono::seconds(60)};
        bool runOnStart{false};
    };

    ExpirationSweeper(InventoryDomainService* service, Options options);
    ~ExpirationSweeper();

    void Start();  // 幂等
    void Stop();  // 取消定时器并 join 线程（幂等）

    // 执行一轮清理；已有一轮在执行时返回 nullopt
    std::optional<SweepReport> RunOnce();

    bool isStarted() const noexcept { return started_.load(); }
    std::uint64_t completedRuns() const noexcept { return completedRuns_.load(); }

private:
    InventoryDomainService* service_;
    Options options_;

    std::mutex lifecycleMutex_;
    std::unique_ptr<EventLoopThread> thread_;
    EventLoop* loop_{nullptr};
    TimerId timer_;

    std::atomic<bool> started_{false};
    std::atomic<bool> sweeping_{false};
    std::atomic<std::uint64_t> completedRuns_{0};
};
