#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "BlockingQueue.h"
#include "MySQLConn.h"

// ------------------ 连接池 ------------------
// 每个数据库一个实例；Acquire() 独占借出一条连接，shared_ptr 析构时自动归还。
// 事务型的工作单元需要在整个生命周期内持有同一条连接，因此不走异步任务队列。
class MySQLConnPool : public std::enable_shared_from_this<MySQLConnPool> {
public:
    explicit MySQLConnPool(const std::string& db);
    ~MySQLConnPool();
    // 获取指定数据库的连接池实例
    static std::shared_ptr<MySQLConnPool> GetInstance(const std::string& db);

    // 初始化连接池
    void InitPool(const MySQLConnInfo& info, int initial_size = 4, int max_size = 32, int max_idle_time = 60, int connect_timeout = 5);

    // 借出一条连接；超时返回 nullptr
    std::shared_ptr<MySQLConn> Acquire(std::chrono::milliseconds timeout = std::chrono::milliseconds(3000));

    // 停止心跳线程并关闭所有连接
    void Shutdown();

    int TotalCount() const { return total_.load(std::memory_order_relaxed); }

private:
    void CreateInitialConnections();
    std::unique_ptr<MySQLConn> TryCreateConnection();
    void Release(MySQLConn* conn);

    // ------------------ 心跳检测 ------------------
    void KeepAliveLoop();
    void StartKeepAlive();
    void StopKeepAlive();

    std::thread keepalive_thread_;
    std::atomic<bool> running_{false};
    std::mutex keepalive_mtx_;
    std::condition_variable keepalive_cv_;
    // ---------------------------------------------

    std::string database_;
    MySQLConnInfo info_;
    std::shared_ptr<BlockingQueue<std::unique_ptr<MySQLConn>>> idle_;
    std::atomic<int> total_{0};

    int initial_size_ = 0;
    int max_size_ = 0;
    int max_idle_time_ = 0;
    int connect_timeout_ = 0;

    static std::unordered_map<std::string, std::weak_ptr<MySQLConnPool>> instances_;
    static std::mutex instance_mtx_;
    std::mutex pool_mtx_;
};
