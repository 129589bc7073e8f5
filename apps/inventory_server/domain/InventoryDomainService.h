#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "domain/InventoryLedger.h"
#include "domain/InventoryPorts.h"
#include "domain/InventoryStore.h"
#include "domain/Reservation.h"
#include "domain/StockMovement.h"

/**
 * @brief InventoryDomainService：库存领域服务
 *
 * 库存变更的唯一入口。每次调用对应一个 TransactionScope，
 * 存储层报告 ConcurrencyConflict 时按 conflictRetries 有限重试，仍失败则原样抛给调用方。
 * 提交成功后失效缓存并发布 stock_changed 事件，两者失败只记录日志。
 *
 * 线程安全：无内部可变状态，可被多个线程同时调用，并发由存储层的行锁保证。
 */
class InventoryDomainService {
public:
    using Clock = std::chrono::system_clock;
    using ClockFn = std::function<Clock::time_point()>;

    struct Dependencies {
        InventoryStore* store{nullptr};
        ProductCatalog* catalog{nullptr};
        StockEventPublisher* events{nullptr};
        StockCacheInvalidator* invalidator{nullptr};
        LedgerSnapshotCache* snapshots{nullptr};
    };

    struct Options {
        std::chrono::seconds defaultReservationTtl{std::chrono::minutes(30)};
        std::chrono::seconds maxReservationTtl{std::chrono::hours(24)};
        int defaultMinimumStockLevel{InventoryLedger::kDefaultMinimumStockLevel};
        int defaultReorderPoint{InventoryLedger::kDefaultReorderPoint};
        int conflictRetries{3};
        std::chrono::milliseconds retryBackoff{20};
        std::size_t sweepBatchSize{200};
        std::size_t maxMovementPage{500};
    };

    struct ReserveRequest {
        std::string productRef;
        std::optional<std::string> variantRef;
        int quantity{0};
        std::string requesterId;
        std::optional<std::string> correlationId;
        std::optional<std::string> source;
        std::optional<std::chrono::seconds> ttl;
    };

    struct StockCheckItem {
        std::string productRef;
        std::optional<std::string> variantRef;
        int quantity{0};
    };

    struct StockLevel {
        StockKey key;
        bool tracked{false};
        int quantityAvailable{0};
        int quantityReserved{0};
        int requested{0};
        bool inStock{false};
        bool lowStock{true};
    };

    struct SweepReport {
        std::size_t scanned{0};
        std::size_t expired{0};
        std::size_t skipped{0};
        std::size_t failed{0};
    };

    InventoryDomainService(Dependencies deps);
    InventoryDomainService(Dependencies deps, Options options);
    InventoryDomainService(Dependencies deps, Options options, ClockFn clock);

    const Dependencies& deps() const noexcept { return deps_; }
    const Options& options() const noexcept { return options_; }

    // ========== 预留 / 释放 / 确认 ==========
    Reservation ReserveStock(const ReserveRequest& request);
    Reservation ReleaseStock(const std::string& reservationId, const std::string& reason);
    Reservation ConfirmReservation(const std::string& reservationId);

    // ========== 盘点与阈值 ==========
    InventoryLedger AdjustStock(const std::string& productRef,
                                const std::optional<std::string>& variantRef,
                                int newTotal,
                                const std::string& reason,
                                const std::optional<std::string>& actor = std::nullopt);
    InventoryLedger CorrectStock(const std::string& productRef,
                                 const std::optional<std::string>& variantRef,
                                 int delta,
                                 const std::string& reason,
                                 const std::optional<std::string>& actor = std::nullopt);
    InventoryLedger UpdateThresholds(const std::string& productRef, const std::optional<std::string>& variantRef, int minimumStockLevel, int reorderPoint);

    // ========== 查询 ==========
    bool IsStockAvailable(const std::string& productRef, const std::optional<std::string>& variantRef, int quantity);
    std::optional<InventoryLedger> GetInventory(const std::string& productRef, const std::optional<std::string>& variantRef = std::nullopt);
    int GetAvailableQuantity(const std::string& productRef, const std::optional<std::string>& variantRef = std::nullopt);
    std::vector<StockLevel> BulkStockCheck(const std::vector<StockCheckItem>& items);

    std::optional<Reservation> GetReservation(const std::string& reservationId);
    std::vector<Reservation> ListActiveReservations(const std::string& requesterId);
    std::vector<StockMovement> ListMovements(const std::string& productRef, const std::optional<std::string>& variantRef, std::size_t limit);
    std::vector<StockMovement> ListMovementsByReference(const std::string& referenceId);
    std::vector<InventoryLedger> ListLedgers(LedgerFilter filter);

    // ========== 过期处理 ==========
    // 已非 ACTIVE 返回 false；成功过期返回 true
    bool ExpireReservation(const std::string& reservationId);
    SweepReport CleanupExpiredReservations();

private:
    template <typename Fn>
    auto withRetry(std::string_view operation, Fn&& fn) -> decltype(fn());

    // 提交后的缓存失效与事件发布
    void afterCommit(const InventoryLedger& ledger, std::string_view operation, bool checkLowStock);

    std::chrono::seconds resolveTtl(const std::optional<std::chrono::seconds>& requested) const;
    StockKey makeKey(const std::string& productRef, const std::optional<std::string>& variantRef) const;
    Clock::time_point now() const { return clock_(); }

private:
    Dependencies deps_;
    Options options_;
    ClockFn clock_;
};
