#pragma once
#include <cppconn/connection.h>
#include <cppconn/driver.h>
#include <cppconn/prepared_statement.h>
#include <cppconn/resultset.h>
#include <cppconn/statement.h>
#include <cppconn/exception.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "MySQLConnInfo.h"

// ------------------ 数据库连接 ------------------
// 单连接封装：同步执行 SQL、显式事务与预编译语句。
// 线程不安全，一个连接同一时刻只由一个持有者（MySQLConnPool 的租约）使用。
class MySQLConn {
public:
    using Clock = std::chrono::steady_clock;

    explicit MySQLConn(const MySQLConnInfo& info);
    ~MySQLConn() noexcept;

    MySQLConn(const MySQLConn&) = delete;
    MySQLConn& operator=(const MySQLConn&) = delete;

    bool Open();
    bool Open(int maxRetries, int retryDelaySec);

    void Close() noexcept;

    // 吞掉 SQLException 只记日志，用于建表等非业务语句
    bool ExecuteStatement(const std::string& sql);

    // 业务语句使用预编译接口，异常交给调用方映射为领域错误
    std::unique_ptr<sql::PreparedStatement> Prepare(const std::string& sql);

    // ========== 事务 ==========
    void Begin();
    void Commit();
    void Rollback() noexcept;
    bool InTransaction() const noexcept { return inTransaction_; }

    bool Ping() noexcept;
    bool IsAlive() const noexcept { return alive_.load(std::memory_order_relaxed); }
    void MarkBroken() noexcept { alive_.store(false, std::memory_order_relaxed); }

    Clock::time_point lastUsed() const noexcept { return lastUsed_; }
    void Touch() noexcept { lastUsed_ = Clock::now(); }

private:
    void requireOpen() const;

    sql::Driver* driver_{nullptr};
    std::unique_ptr<sql::Connection> conn_;
    MySQLConnInfo info_;
    std::atomic<bool> alive_{true};
    bool inTransaction_{false};
    Clock::time_point lastUsed_{Clock::now()};
    std::mutex conn_mtx_;
};
