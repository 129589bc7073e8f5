#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "domain/InventoryStore.h"

/**
 * @brief InMemoryInventoryStore：进程内库存存储
 *
 * 每个库存维度一把互斥锁，工作单元从 Lock* 起持有到 Commit/Rollback；
 * 写入先暂存在工作单元中，Commit 时在数据锁下一次性生效，并再次校验台账版本。
 * 用于测试与 storage.backend = memory 的单机部署。
 */
class InMemoryInventoryStore : public InventoryStore {
public:
    InMemoryInventoryStore() = default;

    std::unique_ptr<InventoryUnitOfWork> Begin() override;

    std::optional<InventoryLedger> FindLedger(const StockKey& key) override;
    std::optional<Reservation> FindReservation(const std::string& reservationId) override;
    std::vector<Reservation> FindExpiredReservations(Clock::time_point now, std::size_t limit, const std::optional<ExpiryCursor>& after) override;
    std::vector<Reservation> FindActiveReservationsByRequester(const std::string& requesterId) override;
    std::vector<StockMovement> ListMovements(const StockKey& key, std::size_t limit) override;
    std::vector<StockMovement> ListMovementsByReference(const std::string& referenceId) override;
    std::vector<InventoryLedger> ListLedgers(LedgerFilter filter) override;

    // ========== 测试与诊断 ==========
    std::size_t LedgerCount() const;
    std::size_t MovementCount() const;
    std::vector<Reservation> AllReservations() const;

private:
    friend class InMemoryUnitOfWork;

    std::shared_ptr<std::mutex> keyMutex(const StockKey& key);

    mutable std::mutex dataMutex_;
    std::unordered_map<std::int64_t, InventoryLedger> ledgers_;
    std::unordered_map<StockKey, std::int64_t, StockKeyHash> ledgerIndex_;
    std::unordered_map<std::string, Reservation> reservations_;
    std::vector<StockMovement> movements_;
    std::unordered_map<StockKey, std::shared_ptr<std::mutex>, StockKeyHash> keyLocks_;
    std::int64_t nextLedgerId_{1};
    std::int64_t nextMovementId_{1};
};
