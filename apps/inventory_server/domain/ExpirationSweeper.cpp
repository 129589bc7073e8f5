#include "domain/ExpirationSweeper.h"

#include <stdexcept>
#include <utility>

#include "EventLoop.h"
#include "EventLoopThread.h"
#include "LogMacros.h"

ExpirationSweeper::ExpirationSweeper(InventoryDomainService* service, Options options) : service_(service), options_(std::move(options)) {
    if (!service_)
        throw std::invalid_argument("ExpirationSweeper: InventoryDomainService cannot be null");
    if (options_.interval.count() <= 0)
        throw std::invalid_argument("ExpirationSweeper: interval must be positive");
}

ExpirationSweeper::~ExpirationSweeper() {
    Stop();
}

void ExpirationSweeper::Start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (started_)
        return;

    thread_ = std::make_unique<EventLoopThread>(EventLoopThread::ThreadInitCallback(), "expiration-sweeper");
    loop_ = thread_->startLoop();

    const double seconds = std::chrono::duration<double>(options_.interval).count();
    timer_ = loop_->runEvery(seconds, [this] { RunOnce(); });
    if (options_.runOnStart)
        loop_->queueInLoop([this] { RunOnce(); });

    started_ = true;
    LOG_INFO("[ExpirationSweeper] Started, interval={}ms", options_.interval.count());
}

void ExpirationSweeper::Stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!started_)
        return;

    loop_->cancel(timer_);
    thread_->stop();  // 等待正在执行的一轮结束
    thread_.reset();
    loop_ = nullptr;
    timer_ = TimerId();

    started_ = false;
    LOG_INFO("[ExpirationSweeper] Stopped after {} runs", completedRuns_.load());
}

std::optional<ExpirationSweeper::SweepReport> ExpirationSweeper::RunOnce() {
    bool expected = false;
    if (!sweeping_.compare_exchange_strong(expected, true)) {
        LOG_DEBUG("[ExpirationSweeper] Previous sweep still running, skipping tick");
        return std::nullopt;
    }

    struct FlagGuard {
        std::atomic<bool>& flag;
        ~FlagGuard() { flag.store(false); }
    } guard{sweeping_};

    try {
        auto report = service_->CleanupExpiredReservations();
        completedRuns_.fetch_add(1);
        return report;
    } catch (const std::exception& e) {
        // 批量查询本身失败（如数据库不可用），下一轮再试
        LOG_ERROR("[ExpirationSweeper] Sweep failed: {}", e.what());
        completedRuns_.fetch_add(1);
        return SweepReport{};
    }
}
