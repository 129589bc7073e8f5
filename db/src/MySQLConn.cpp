#include "MySQLConn.h"

#include <cppconn/exception.h>

#include <thread>

#include "LogMacros.h"

namespace {
void LogSQLError(std::string_view what, const sql::SQLException& e) {
    LOG_ERROR("[MySQLConn] {} failed: {} (Code: {}, SQLState: {})", what, e.what(), e.getErrorCode(), e.getSQLStateCStr());
}
}  // namespace

// ========== 连接生命周期 ==========

MySQLConn::MySQLConn(const MySQLConnInfo& info) : driver_(get_driver_instance()), info_(info) {}

MySQLConn::~MySQLConn() noexcept {
    Close();
}

bool MySQLConn::Open() {
    return Open(3, 2);
}

bool MySQLConn::Open(int maxRetries, int retryDelaySec) {
    sql::ConnectOptionsMap options;
    options["hostName"] = sql::SQLString(info_.url);
    options["userName"] = sql::SQLString(info_.user);
    options["password"] = sql::SQLString(info_.password);
    options["schema"] = sql::SQLString(info_.database);
    options["OPT_CHARSET_NAME"] = sql::SQLString(info_.charset);
    options["OPT_CONNECT_TIMEOUT"] = info_.timeout_sec;
    options["OPT_READ_TIMEOUT"] = info_.timeout_sec;
    options["OPT_WRITE_TIMEOUT"] = info_.timeout_sec;

    for (int attempt = 1; attempt <= maxRetries; ++attempt) {
        if (attempt > 1)
            std::this_thread::sleep_for(std::chrono::seconds(retryDelaySec));
        try {
            std::lock_guard<std::mutex> lock(conn_mtx_);
            conn_.reset(driver_->connect(options));
            conn_->setAutoCommit(true);
            inTransaction_ = false;
            alive_.store(true, std::memory_order_relaxed);
            Touch();
            LOG_INFO("[MySQLConn] Connected to {}", info_.describe());
            return true;
        } catch (const sql::SQLException& e) {
            alive_.store(false, std::memory_order_relaxed);
            LOG_WARN("[MySQLConn] Connect attempt {}/{} to {} failed: {} (Code: {})", attempt, maxRetries, info_.describe(), e.what(), e.getErrorCode());
        }
    }
    LOG_ERROR("[MySQLConn] Giving up on {} after {} attempts", info_.describe(), maxRetries);
    return false;
}

void MySQLConn::Close() noexcept {
    std::lock_guard<std::mutex> lock(conn_mtx_);
    if (conn_) {
        try {
            conn_->close();
        } catch (const sql::SQLException& e) {
            LOG_DEBUG("[MySQLConn] close() on a dead connection: {}", e.what());
        }
        conn_.reset();
    }
    inTransaction_ = false;
    alive_.store(false, std::memory_order_relaxed);
}

// ========== 语句 ==========

bool MySQLConn::ExecuteStatement(const std::string& sql) {
    if (!conn_)
        return false;
    try {
        std::unique_ptr<sql::Statement> stmt(conn_->createStatement());
        stmt->execute(sql);
        Touch();
        return true;
    } catch (const sql::SQLException& e) {
        LogSQLError("Execute", e);
        return false;
    }
}

std::unique_ptr<sql::PreparedStatement> MySQLConn::Prepare(const std::string& sql) {
    requireOpen();
    Touch();
    return std::unique_ptr<sql::PreparedStatement>(conn_->prepareStatement(sql));
}

// ========== 事务 ==========

void MySQLConn::Begin() {
    requireOpen();
    conn_->setAutoCommit(false);
    inTransaction_ = true;
    Touch();
}

void MySQLConn::Commit() {
    requireOpen();
    conn_->commit();
    conn_->setAutoCommit(true);
    inTransaction_ = false;
}

void MySQLConn::Rollback() noexcept {
    if (!conn_ || !inTransaction_)
        return;
    inTransaction_ = false;
    try {
        conn_->rollback();
        conn_->setAutoCommit(true);
    } catch (const sql::SQLException& e) {
        // 回滚都失败了，交给连接池重连
        LogSQLError("Rollback", e);
        alive_.store(false, std::memory_order_relaxed);
    }
}

bool MySQLConn::Ping() noexcept {
    std::lock_guard<std::mutex> lock(conn_mtx_);
    if (!conn_)
        return false;
    bool ok = false;
    try {
        ok = conn_->isValid();
    } catch (const sql::SQLException& e) {
        LOG_WARN("[MySQLConn] Ping failed: {}", e.what());
    }
    alive_.store(ok, std::memory_order_relaxed);
    return ok;
}

void MySQLConn::requireOpen() const {
    if (!conn_)
        throw sql::SQLException("MySQLConn: connection is not open");
}
