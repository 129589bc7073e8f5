#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "domain/InventoryStore.h"

class MySQLConnPool;
class MySQLConn;

namespace sql {
class ResultSet;
class SQLException;
}  // namespace sql

/**
 * @brief MySQLInventoryStore：基于 MySQL (InnoDB) 的库存存储
 *
 * 每个工作单元独占租用一条连接并开启事务：
 *  - 行锁：SELECT ... FOR UPDATE，先预留单后台账；
 *  - 台账写入：UPDATE ... WHERE id=? AND version=?，影响 0 行即并发冲突；
 *  - 预留单写入：UPDATE ... WHERE id=? AND status='ACTIVE'。
 * 死锁(1213)、锁等待超时(1205)、唯一键冲突(1062) 映射为 ConcurrencyConflict，其余为 StorageFailure。
 */
class MySQLInventoryStore : public InventoryStore {
public:
    struct Options {
        std::string ledgerTable{"inventory_ledgers"};
        std::string reservationTable{"stock_reservations"};
        std::string movementTable{"stock_movements"};
        std::chrono::milliseconds acquireTimeout{3000};
    };

    MySQLInventoryStore(std::shared_ptr<MySQLConnPool> pool, Options options);

    std::shared_ptr<MySQLConnPool> pool() const noexcept { return pool_; }
    const Options& options() const noexcept { return options_; }

    void EnsureSchema();

    std::unique_ptr<InventoryUnitOfWork> Begin() override;

    std::optional<InventoryLedger> FindLedger(const StockKey& key) override;
    std::optional<Reservation> FindReservation(const std::string& reservationId) override;
    std::vector<Reservation> FindExpiredReservations(Clock::time_point now, std::size_t limit, const std::optional<ExpiryCursor>& after) override;
    std::vector<Reservation> FindActiveReservationsByRequester(const std::string& requesterId) override;
    std::vector<StockMovement> ListMovements(const StockKey& key, std::size_t limit) override;
    std::vector<StockMovement> ListMovementsByReference(const std::string& referenceId) override;
    std::vector<InventoryLedger> ListLedgers(LedgerFilter filter) override;

private:
    friend class MySQLUnitOfWork;

    std::shared_ptr<MySQLConn> acquire() const;

    // 列清单与结果解析
    std::string ledgerColumns() const;
    std::string reservationColumns() const;
    std::string movementColumns() const;
    static InventoryLedger ParseLedger(sql::ResultSet* rs);
    static Reservation ParseReservation(sql::ResultSet* rs);
    static StockMovement ParseMovement(sql::ResultSet* rs);

    std::shared_ptr<MySQLConnPool> pool_;
    Options options_;
    bool schemaEnsured_{false};
};

// 将 SQLException 转换为领域错误并抛出；连接类错误同时标记连接失效
[[noreturn]] void ThrowStoreError(const sql::SQLException& e, MySQLConn* conn, const std::string& context);
