#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "NonCopyable.h"
#include "domain/InventoryLedger.h"
#include "domain/Reservation.h"
#include "domain/StockMovement.h"

enum class LedgerFilter : std::uint8_t { kLowStock = 0, kOutOfStock, kBelowMinimum, kWithReservations };

std::string ToString(LedgerFilter filter);
std::optional<LedgerFilter> LedgerFilterFromString(std::string_view filter);

/**
 * @brief InventoryUnitOfWork：一次原子操作的持久化上下文
 *
 * Lock* 接口在返回前取得行级互斥（MySQL 为 SELECT ... FOR UPDATE），持有到 Commit/Rollback。
 * 加锁顺序固定为先预留单、后台账。
 * 写接口失败抛出 InventoryError：版本不一致或行已被他人终结为 ConcurrencyConflict，其余为 StorageFailure。
 */
class InventoryUnitOfWork {
public:
    virtual ~InventoryUnitOfWork() = default;

    virtual std::optional<InventoryLedger> LockLedger(const StockKey& key) = 0;
    virtual std::optional<InventoryLedger> LockLedgerById(std::int64_t ledgerId) = 0;
    virtual std::optional<Reservation> LockReservation(const std::string& reservationId) = 0;

    // 分配 id，version 置 0
    virtual InventoryLedger InsertLedger(InventoryLedger ledger) = 0;
    // 以 ledger.version() 做乐观锁校验，成功后版本号加一并回写到 ledger
    virtual void UpdateLedger(InventoryLedger& ledger) = 0;

    virtual void InsertReservation(const Reservation& reservation) = 0;
    // 仅当存储中的状态仍为 ACTIVE 时更新
    virtual void UpdateReservation(const Reservation& reservation) = 0;

    // 分配流水 id 并回写
    virtual void AppendMovement(StockMovement& movement) = 0;

    virtual void Commit() = 0;
    virtual void Rollback() noexcept = 0;
};

// 过期扫描的翻页游标：上一批最后一条的 (expiresAt, id)
struct ExpiryCursor {
    std::chrono::system_clock::time_point expiresAt;
    std::string id;
};

/**
 * @brief InventoryStore：库存持久化端口
 *
 * 只读查询直接在存储上执行，不加锁；所有写入必须经由 Begin() 返回的工作单元。
 */
class InventoryStore {
public:
    using Clock = std::chrono::system_clock;

    virtual ~InventoryStore() = default;

    virtual std::unique_ptr<InventoryUnitOfWork> Begin() = 0;

    virtual std::optional<InventoryLedger> FindLedger(const StockKey& key) = 0;
    virtual std::optional<Reservation> FindReservation(const std::string& reservationId) = 0;
    // ACTIVE 且 expiresAt <= now，按 (expiresAt, id) 升序；after 非空时只返回严格位于游标之后的行
    virtual std::vector<Reservation> FindExpiredReservations(Clock::time_point now, std::size_t limit, const std::optional<ExpiryCursor>& after) = 0;
    virtual std::vector<Reservation> FindActiveReservationsByRequester(const std::string& requesterId) = 0;
    // 按发生时间倒序
    virtual std::vector<StockMovement> ListMovements(const StockKey& key, std::size_t limit) = 0;
    virtual std::vector<StockMovement> ListMovementsByReference(const std::string& referenceId) = 0;
    virtual std::vector<InventoryLedger> ListLedgers(LedgerFilter filter) = 0;
};

// RAII 事务：析构时若未提交则回滚
class TransactionScope : NonCopyable {
public:
    explicit TransactionScope(InventoryStore& store) : uow_(store.Begin()) {}
    ~TransactionScope() {
        if (uow_ && !committed_)
            uow_->Rollback();
    }

    InventoryUnitOfWork* operator->() const noexcept { return uow_.get(); }
    InventoryUnitOfWork& uow() const noexcept { return *uow_; }

    void Commit() {
        uow_->Commit();
        committed_ = true;
    }

private:
    std::unique_ptr<InventoryUnitOfWork> uow_;
    bool committed_{false};
};
