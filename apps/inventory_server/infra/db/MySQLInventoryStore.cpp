#include "infra/db/MySQLInventoryStore.h"

#include <cppconn/datatype.h>
#include <cppconn/exception.h>
#include <cppconn/prepared_statement.h>
#include <cppconn/resultset.h>
#include <cppconn/statement.h>

#include <cstdio>
#include <ctime>
#include <format>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "LogMacros.h"
#include "MySQLConnPool.h"
#include "domain/InventoryErrors.h"

// ------------------- 时间与可空列辅助 -------------------

namespace {

using Clock = std::chrono::system_clock;

constexpr int kErrDuplicateKey = 1062;
constexpr int kErrLockWaitTimeout = 1205;
constexpr int kErrDeadlock = 1213;
constexpr int kErrServerGone = 2006;
constexpr int kErrServerLost = 2013;

// UTC，毫秒精度，对应 DATETIME(3)
std::string TimeToSQL(Clock::time_point tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t tt = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<int>(ms % 1000));
    return buf;
}

Clock::time_point TimeFromSQL(const std::string& s) {
    std::tm tm{};
    int millis = 0;
    if (std::sscanf(s.c_str(), "%d-%d-%d %d:%d:%d.%d", &tm.tm_year, &tm.tm_mon, &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &millis) < 6)
        throw StorageFailure(std::format("malformed DATETIME value '{}'", s));
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    return Clock::from_time_t(timegm(&tm)) + std::chrono::milliseconds(millis);
}

std::optional<std::string> OptString(sql::ResultSet* rs, const char* column) {
    if (rs->isNull(column))
        return std::nullopt;
    return std::string(rs->getString(column));
}

void SetOptString(sql::PreparedStatement* stmt, unsigned int idx, const std::optional<std::string>& value) {
    if (value)
        stmt->setString(idx, *value);
    else
        stmt->setNull(idx, sql::DataType::VARCHAR);
}

std::string VariantColumn(const StockKey& key) {
    return key.variantRef.value_or(std::string());
}

std::int64_t LastInsertId(MySQLConn* conn) {
    auto stmt = conn->Prepare("SELECT LAST_INSERT_ID() AS id");
    std::unique_ptr<sql::ResultSet> rs(stmt->executeQuery());
    if (!rs->next())
        throw StorageFailure("LAST_INSERT_ID() returned no row");
    return rs->getInt64("id");
}

}  // namespace

void ThrowStoreError(const sql::SQLException& e, MySQLConn* conn, const std::string& context) {
    const int code = e.getErrorCode();
    if (code == kErrDeadlock || code == kErrLockWaitTimeout || code == kErrDuplicateKey)
        throw ConcurrencyConflict(std::format("{}: {} (Code: {})", context, e.what(), code));

    if (conn && (code == kErrServerGone || code == kErrServerLost))
        conn->MarkBroken();
    LOG_ERROR("[MySQLInventoryStore] {} failed: {} (Code: {}, SQLState: {})", context, e.what(), code, e.getSQLStateCStr());
    throw StorageFailure(std::format("{}: {}", context, e.what()));
}

// ========== 工作单元 ==========

class MySQLUnitOfWork : public InventoryUnitOfWork {
public:
    MySQLUnitOfWork(const MySQLInventoryStore& store, std::shared_ptr<MySQLConn> conn) : store_(store), conn_(std::move(conn)) {
        try {
            conn_->Begin();
        } catch (const sql::SQLException& e) {
            ThrowStoreError(e, conn_.get(), "BEGIN");
        }
    }

    ~MySQLUnitOfWork() override { Rollback(); }

    std::optional<InventoryLedger> LockLedger(const StockKey& key) override {
        try {
            auto stmt = conn_->Prepare(std::format("SELECT {} FROM {} WHERE product_ref=? AND variant_ref=? FOR UPDATE", store_.ledgerColumns(), store_.options_.ledgerTable));
            stmt->setString(1, key.productRef);
            stmt->setString(2, VariantColumn(key));
            std::unique_ptr<sql::ResultSet> rs(stmt->executeQuery());
            if (!rs->next())
                return std::nullopt;
            return MySQLInventoryStore::ParseLedger(rs.get());
        } catch (const sql::SQLException& e) {
            ThrowStoreError(e, conn_.get(), "LockLedger " + key.ToString());
        }
    }

    std::optional<InventoryLedger> LockLedgerById(std::int64_t ledgerId) override {
        try {
            auto stmt = conn_->Prepare(std::format("SELECT {} FROM {} WHERE id=? FOR UPDATE", store_.ledgerColumns(), store_.options_.ledgerTable));
            stmt->setInt64(1, ledgerId);
            std::unique_ptr<sql::ResultSet> rs(stmt->executeQuery());
            if (!rs->next())
                return std::nullopt;
            return MySQLInventoryStore::ParseLedger(rs.get());
        } catch (const sql::SQLException& e) {
            ThrowStoreError(e, conn_.get(), std::format("LockLedgerById {}", ledgerId));
        }
    }

    std::optional<Reservation> LockReservation(const std::string& reservationId) override {
        try {
            auto stmt = conn_->Prepare(std::format("SELECT {} FROM {} WHERE id=? FOR UPDATE", store_.reservationColumns(), store_.options_.reservationTable));
            stmt->setString(1, reservationId);
            std::unique_ptr<sql::ResultSet> rs(stmt->executeQuery());
            if (!rs->next())
                return std::nullopt;
            return MySQLInventoryStore::ParseReservation(rs.get());
        } catch (const sql::SQLException& e) {
            ThrowStoreError(e, conn_.get(), "LockReservation " + reservationId);
        }
    }

    InventoryLedger InsertLedger(InventoryLedger ledger) override {
        try {
            auto stmt = conn_->Prepare(std::format(
                "INSERT INTO {} (product_ref,variant_ref,quantity_available,quantity_reserved,minimum_stock_level,reorder_point,last_updated,version)"
                " VALUES (?,?,?,?,?,?,?,0)",
                store_.options_.ledgerTable));
            stmt->setString(1, ledger.key().productRef);
            stmt->setString(2, VariantColumn(ledger.key()));
            stmt->setInt(3, ledger.quantityAvailable());
            stmt->setInt(4, ledger.quantityReserved());
            stmt->setInt(5, ledger.minimumStockLevel());
            stmt->setInt(6, ledger.reorderPoint());
            stmt->setDateTime(7, TimeToSQL(ledger.lastUpdated()));
            stmt->executeUpdate();
            ledger.SetId(LastInsertId(conn_.get()));
            ledger.SetVersion(0);
            return ledger;
        } catch (const sql::SQLException& e) {
            ThrowStoreError(e, conn_.get(), "InsertLedger " + ledger.key().ToString());
        }
    }

    void UpdateLedger(InventoryLedger& ledger) override {
        int affected = 0;
        try {
            auto stmt = conn_->Prepare(std::format(
                "UPDATE {} SET quantity_available=?,quantity_reserved=?,minimum_stock_level=?,reorder_point=?,last_updated=?,version=version+1"
                " WHERE id=? AND version=?",
                store_.options_.ledgerTable));
            stmt->setInt(1, ledger.quantityAvailable());
            stmt->setInt(2, ledger.quantityReserved());
            stmt->setInt(3, ledger.minimumStockLevel());
            stmt->setInt(4, ledger.reorderPoint());
            stmt->setDateTime(5, TimeToSQL(ledger.lastUpdated()));
            stmt->setInt64(6, ledger.id());
            stmt->setInt64(7, ledger.version());
            affected = stmt->executeUpdate();
        } catch (const sql::SQLException& e) {
            ThrowStoreError(e, conn_.get(), std::format("UpdateLedger {}", ledger.id()));
        }
        if (affected == 0)
            throw ConcurrencyConflict(std::format("ledger {} version {} is stale", ledger.id(), ledger.version()));
        ledger.SetVersion(ledger.version() + 1);
    }

    void InsertReservation(const Reservation& r) override {
        try {
            auto stmt = conn_->Prepare(std::format(
                "INSERT INTO {} (id,ledger_id,product_ref,variant_ref,quantity,requester_id,correlation_id,source,created_at,expires_at,status)"
                " VALUES (?,?,?,?,?,?,?,?,?,?,?)",
                store_.options_.reservationTable));
            stmt->setString(1, r.id());
            stmt->setInt64(2, r.ledgerId());
            stmt->setString(3, r.key().productRef);
            stmt->setString(4, VariantColumn(r.key()));
            stmt->setInt(5, r.quantity());
            stmt->setString(6, r.requesterId());
            SetOptString(stmt.get(), 7, r.correlationId());
            SetOptString(stmt.get(), 8, r.source());
            stmt->setDateTime(9, TimeToSQL(r.createdAt()));
            stmt->setDateTime(10, TimeToSQL(r.expiresAt()));
            stmt->setString(11, ToString(r.status()));
            stmt->executeUpdate();
        } catch (const sql::SQLException& e) {
            ThrowStoreError(e, conn_.get(), "InsertReservation " + r.id());
        }
    }

    void UpdateReservation(const Reservation& r) override {
        int affected = 0;
        try {
            auto stmt = conn_->Prepare(std::format("UPDATE {} SET status=?,resolved_at=?,resolution_reason=? WHERE id=? AND status='ACTIVE'", store_.options_.reservationTable));
            stmt->setString(1, ToString(r.status()));
            if (r.resolvedAt())
                stmt->setDateTime(2, TimeToSQL(*r.resolvedAt()));
            else
                stmt->setNull(2, sql::DataType::TIMESTAMP);
            SetOptString(stmt.get(), 3, r.resolutionReason());
            stmt->setString(4, r.id());
            affected = stmt->executeUpdate();
        } catch (const sql::SQLException& e) {
            ThrowStoreError(e, conn_.get(), "UpdateReservation " + r.id());
        }
        if (affected == 0)
            throw ConcurrencyConflict(std::format("reservation {} is no longer ACTIVE", r.id()));
    }

    void AppendMovement(StockMovement& m) override {
        try {
            auto stmt = conn_->Prepare(std::format(
                "INSERT INTO {} (ledger_id,product_ref,variant_ref,movement_type,quantity_change,reason,reference_id,actor,occurred_at)"
                " VALUES (?,?,?,?,?,?,?,?,?)",
                store_.options_.movementTable));
            stmt->setInt64(1, m.ledgerId);
            stmt->setString(2, m.key.productRef);
            stmt->setString(3, VariantColumn(m.key));
            stmt->setString(4, ToString(m.type));
            stmt->setInt(5, m.quantityChange);
            stmt->setString(6, m.reason);
            SetOptString(stmt.get(), 7, m.referenceId);
            SetOptString(stmt.get(), 8, m.actor);
            stmt->setDateTime(9, TimeToSQL(m.occurredAt));
            stmt->executeUpdate();
            m.id = LastInsertId(conn_.get());
        } catch (const sql::SQLException& e) {
            ThrowStoreError(e, conn_.get(), "AppendMovement");
        }
    }

    void Commit() override {
        try {
            conn_->Commit();
            finished_ = true;
        } catch (const sql::SQLException& e) {
            ThrowStoreError(e, conn_.get(), "COMMIT");
        }
    }

    void Rollback() noexcept override {
        if (finished_)
            return;
        finished_ = true;
        conn_->Rollback();
    }

private:
    const MySQLInventoryStore& store_;
    std::shared_ptr<MySQLConn> conn_;  // 析构时归还连接池
    bool finished_{false};
};

// ========== 构造与模式初始化 ==========

MySQLInventoryStore::MySQLInventoryStore(std::shared_ptr<MySQLConnPool> pool, Options options) : pool_(std::move(pool)), options_(std::move(options)) {
    if (!pool_) {
        throw std::invalid_argument("MySQLInventoryStore: MySQLConnPool cannot be null");
    }
}

void MySQLInventoryStore::EnsureSchema() {
    if (schemaEnsured_)
        return;
    auto conn = acquire();

    std::ostringstream ledgers;
    ledgers << "CREATE TABLE IF NOT EXISTS " << options_.ledgerTable << " ("
            << "id BIGINT AUTO_INCREMENT PRIMARY KEY,"
            << "product_ref VARCHAR(64) NOT NULL,"
            << "variant_ref VARCHAR(64) NOT NULL DEFAULT '',"
            << "quantity_available INT NOT NULL,"
            << "quantity_reserved INT NOT NULL,"
            << "minimum_stock_level INT NOT NULL,"
            << "reorder_point INT NOT NULL,"
            << "last_updated DATETIME(3) NOT NULL,"
            << "version BIGINT NOT NULL DEFAULT 0,"
            << "UNIQUE KEY uk_ledger_key (product_ref, variant_ref),"
            << "CHECK (quantity_available >= 0),"
            << "CHECK (quantity_reserved >= 0))";

    std::ostringstream reservations;
    reservations << "CREATE TABLE IF NOT EXISTS " << options_.reservationTable << " ("
                 << "id CHAR(36) PRIMARY KEY,"
                 << "ledger_id BIGINT NOT NULL,"
                 << "product_ref VARCHAR(64) NOT NULL,"
                 << "variant_ref VARCHAR(64) NOT NULL DEFAULT '',"
                 << "quantity INT NOT NULL,"
                 << "requester_id VARCHAR(64) NOT NULL,"
                 << "correlation_id VARCHAR(64) NULL,"
                 << "source VARCHAR(32) NULL,"
                 << "created_at DATETIME(3) NOT NULL,"
                 << "expires_at DATETIME(3) NOT NULL,"
                 << "status VARCHAR(16) NOT NULL,"
                 << "resolved_at DATETIME(3) NULL,"
                 << "resolution_reason VARCHAR(255) NULL,"
                 << "KEY idx_status_expires (status, expires_at),"
                 << "KEY idx_requester_status (requester_id, status),"
                 << "KEY idx_ledger (ledger_id))";

    std::ostringstream movements;
    movements << "CREATE TABLE IF NOT EXISTS " << options_.movementTable << " ("
              << "id BIGINT AUTO_INCREMENT PRIMARY KEY,"
              << "ledger_id BIGINT NOT NULL,"
              << "product_ref VARCHAR(64) NOT NULL,"
              << "variant_ref VARCHAR(64) NOT NULL DEFAULT '',"
              << "movement_type VARCHAR(16) NOT NULL,"
              << "quantity_change INT NOT NULL,"
              << "reason VARCHAR(255) NOT NULL,"
              << "reference_id VARCHAR(64) NULL,"
              << "actor VARCHAR(64) NULL,"
              << "occurred_at DATETIME(3) NOT NULL,"
              << "KEY idx_ledger_time (ledger_id, occurred_at),"
              << "KEY idx_reference (reference_id))";

    for (const auto& ddl : {ledgers.str(), reservations.str(), movements.str()}) {
        if (!conn->ExecuteStatement(ddl))
            throw std::runtime_error("MySQLInventoryStore: failed to create inventory tables");
    }
    schemaEnsured_ = true;
    LOG_INFO("[MySQLInventoryStore] Schema ensured ({}, {}, {})", options_.ledgerTable, options_.reservationTable, options_.movementTable);
}

std::shared_ptr<MySQLConn> MySQLInventoryStore::acquire() const {
    auto conn = pool_->Acquire(options_.acquireTimeout);
    if (!conn)
        throw StorageFailure("no MySQL connection available");
    return conn;
}

std::unique_ptr<InventoryUnitOfWork> MySQLInventoryStore::Begin() {
    return std::make_unique<MySQLUnitOfWork>(*this, acquire());
}

// ========== 只读查询 ==========

std::optional<InventoryLedger> MySQLInventoryStore::FindLedger(const StockKey& key) {
    auto conn = acquire();
    try {
        auto stmt = conn->Prepare(std::format("SELECT {} FROM {} WHERE product_ref=? AND variant_ref=?", ledgerColumns(), options_.ledgerTable));
        stmt->setString(1, key.productRef);
        stmt->setString(2, VariantColumn(key));
        std::unique_ptr<sql::ResultSet> rs(stmt->executeQuery());
        if (!rs->next())
            return std::nullopt;
        return ParseLedger(rs.get());
    } catch (const sql::SQLException& e) {
        ThrowStoreError(e, conn.get(), "FindLedger " + key.ToString());
    }
}

std::optional<Reservation> MySQLInventoryStore::FindReservation(const std::string& reservationId) {
    auto conn = acquire();
    try {
        auto stmt = conn->Prepare(std::format("SELECT {} FROM {} WHERE id=?", reservationColumns(), options_.reservationTable));
        stmt->setString(1, reservationId);
        std::unique_ptr<sql::ResultSet> rs(stmt->executeQuery());
        if (!rs->next())
            return std::nullopt;
        return ParseReservation(rs.get());
    } catch (const sql::SQLException& e) {
        ThrowStoreError(e, conn.get(), "FindReservation " + reservationId);
    }
}

std::vector<Reservation> MySQLInventoryStore::FindExpiredReservations(Clock::time_point now, std::size_t limit, const std::optional<ExpiryCursor>& after) {
    auto conn = acquire();
    try {
        const char* cursorClause = after ? " AND (expires_at>? OR (expires_at=? AND id>?))" : "";
        auto stmt = conn->Prepare(std::format("SELECT {} FROM {} WHERE status='ACTIVE' AND expires_at<=?{} ORDER BY expires_at, id LIMIT {}", reservationColumns(),
                                              options_.reservationTable, cursorClause, limit));
        stmt->setDateTime(1, TimeToSQL(now));
        if (after) {
            stmt->setDateTime(2, TimeToSQL(after->expiresAt));
            stmt->setDateTime(3, TimeToSQL(after->expiresAt));
            stmt->setString(4, after->id);
        }
        std::unique_ptr<sql::ResultSet> rs(stmt->executeQuery());
        std::vector<Reservation> result;
        while (rs->next())
            result.push_back(ParseReservation(rs.get()));
        return result;
    } catch (const sql::SQLException& e) {
        ThrowStoreError(e, conn.get(), "FindExpiredReservations");
    }
}

std::vector<Reservation> MySQLInventoryStore::FindActiveReservationsByRequester(const std::string& requesterId) {
    auto conn = acquire();
    try {
        auto stmt = conn->Prepare(
            std::format("SELECT {} FROM {} WHERE requester_id=? AND status='ACTIVE' ORDER BY created_at", reservationColumns(), options_.reservationTable));
        stmt->setString(1, requesterId);
        std::unique_ptr<sql::ResultSet> rs(stmt->executeQuery());
        std::vector<Reservation> result;
        while (rs->next())
            result.push_back(ParseReservation(rs.get()));
        return result;
    } catch (const sql::SQLException& e) {
        ThrowStoreError(e, conn.get(), "FindActiveReservationsByRequester " + requesterId);
    }
}

std::vector<StockMovement> MySQLInventoryStore::ListMovements(const StockKey& key, std::size_t limit) {
    auto conn = acquire();
    try {
        auto stmt = conn->Prepare(std::format("SELECT {} FROM {} WHERE product_ref=? AND variant_ref=? ORDER BY occurred_at DESC, id DESC LIMIT {}", movementColumns(),
                                              options_.movementTable, limit));
        stmt->setString(1, key.productRef);
        stmt->setString(2, VariantColumn(key));
        std::unique_ptr<sql::ResultSet> rs(stmt->executeQuery());
        std::vector<StockMovement> result;
        while (rs->next())
            result.push_back(ParseMovement(rs.get()));
        return result;
    } catch (const sql::SQLException& e) {
        ThrowStoreError(e, conn.get(), "ListMovements " + key.ToString());
    }
}

std::vector<StockMovement> MySQLInventoryStore::ListMovementsByReference(const std::string& referenceId) {
    auto conn = acquire();
    try {
        auto stmt = conn->Prepare(std::format("SELECT {} FROM {} WHERE reference_id=? ORDER BY id", movementColumns(), options_.movementTable));
        stmt->setString(1, referenceId);
        std::unique_ptr<sql::ResultSet> rs(stmt->executeQuery());
        std::vector<StockMovement> result;
        while (rs->next())
            result.push_back(ParseMovement(rs.get()));
        return result;
    } catch (const sql::SQLException& e) {
        ThrowStoreError(e, conn.get(), "ListMovementsByReference " + referenceId);
    }
}

std::vector<InventoryLedger> MySQLInventoryStore::ListLedgers(LedgerFilter filter) {
    std::string where;
    switch (filter) {
        case LedgerFilter::kLowStock:         where = "quantity_available <= reorder_point"; break;
        case LedgerFilter::kOutOfStock:       where = "quantity_available = 0"; break;
        case LedgerFilter::kBelowMinimum:     where = "quantity_available < minimum_stock_level"; break;
        case LedgerFilter::kWithReservations: where = "quantity_reserved > 0"; break;
    }

    auto conn = acquire();
    try {
        auto stmt = conn->Prepare(std::format("SELECT {} FROM {} WHERE {} ORDER BY id", ledgerColumns(), options_.ledgerTable, where));
        std::unique_ptr<sql::ResultSet> rs(stmt->executeQuery());
        std::vector<InventoryLedger> result;
        while (rs->next())
            result.push_back(ParseLedger(rs.get()));
        return result;
    } catch (const sql::SQLException& e) {
        ThrowStoreError(e, conn.get(), "ListLedgers " + ToString(filter));
    }
}

// ------------------- 列清单与结果解析 -------------------

std::string MySQLInventoryStore::ledgerColumns() const {
    return "id,product_ref,variant_ref,quantity_available,quantity_reserved,minimum_stock_level,reorder_point,last_updated,version";
}

std::string MySQLInventoryStore::reservationColumns() const {
    return "id,ledger_id,product_ref,variant_ref,quantity,requester_id,correlation_id,source,created_at,expires_at,status,resolved_at,resolution_reason";
}

std::string MySQLInventoryStore::movementColumns() const {
    return "id,ledger_id,product_ref,variant_ref,movement_type,quantity_change,reason,reference_id,actor,occurred_at";
}

InventoryLedger MySQLInventoryStore::ParseLedger(sql::ResultSet* rs) {
    InventoryLedger::Record r;
    r.id = rs->getInt64("id");
    r.key = StockKey::Of(std::string(rs->getString("product_ref")), std::string(rs->getString("variant_ref")));
    r.quantityAvailable = rs->getInt("quantity_available");
    r.quantityReserved = rs->getInt("quantity_reserved");
    r.minimumStockLevel = rs->getInt("minimum_stock_level");
    r.reorderPoint = rs->getInt("reorder_point");
    r.lastUpdated = TimeFromSQL(std::string(rs->getString("last_updated")));
    r.version = rs->getInt64("version");
    return InventoryLedger::FromRecord(r);
}

Reservation MySQLInventoryStore::ParseReservation(sql::ResultSet* rs) {
    Reservation::Record r;
    r.id = std::string(rs->getString("id"));
    r.ledgerId = rs->getInt64("ledger_id");
    r.key = StockKey::Of(std::string(rs->getString("product_ref")), std::string(rs->getString("variant_ref")));
    r.quantity = rs->getInt("quantity");
    r.requesterId = std::string(rs->getString("requester_id"));
    r.correlationId = OptString(rs, "correlation_id");
    r.source = OptString(rs, "source");
    r.createdAt = TimeFromSQL(std::string(rs->getString("created_at")));
    r.expiresAt = TimeFromSQL(std::string(rs->getString("expires_at")));
    r.status = ReservationStatusFromString(std::string(rs->getString("status")));
    if (!rs->isNull("resolved_at"))
        r.resolvedAt = TimeFromSQL(std::string(rs->getString("resolved_at")));
    r.resolutionReason = OptString(rs, "resolution_reason");
    return Reservation::FromRecord(r);
}

StockMovement MySQLInventoryStore::ParseMovement(sql::ResultSet* rs) {
    StockMovement m;
    m.id = rs->getInt64("id");
    m.ledgerId = rs->getInt64("ledger_id");
    m.key = StockKey::Of(std::string(rs->getString("product_ref")), std::string(rs->getString("variant_ref")));
    m.type = MovementTypeFromString(std::string(rs->getString("movement_type")));
    m.quantityChange = rs->getInt("quantity_change");
    m.reason = std::string(rs->getString("reason"));
    m.referenceId = OptString(rs, "reference_id");
    m.actor = OptString(rs, "actor");
    m.occurredAt = TimeFromSQL(std::string(rs->getString("occurred_at")));
    return m;
}
