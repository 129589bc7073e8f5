#include "MySQLConnPool.h"

#include <algorithm>

#include "LogMacros.h"

// ------------------ 静态成员定义 ------------------
std::unordered_map<std::string, std::weak_ptr<MySQLConnPool>> MySQLConnPool::instances_;
std::mutex MySQLConnPool::instance_mtx_;

// ------------------ 构造与析构 ------------------
MySQLConnPool::MySQLConnPool(const std::string& db) : database_(db) {}

MySQLConnPool::~MySQLConnPool() {
    Shutdown();
}

// ------------------ 单例获取 ------------------
std::shared_ptr<MySQLConnPool> MySQLConnPool::GetInstance(const std::string& db) {
    std::lock_guard<std::mutex> lock(instance_mtx_);
    auto it = instances_.find(db);
    if (it != instances_.end()) {
        if (auto ptr = it->second.lock())
            return ptr;
    }
    auto pool = std::make_shared<MySQLConnPool>(db);
    instances_[db] = pool;
    return pool;
}

// ------------------ 初始化连接池 ------------------
void MySQLConnPool::InitPool(const MySQLConnInfo& info, int initial_size, int max_size, int max_idle_time, int connect_timeout) {
    std::lock_guard<std::mutex> lock(pool_mtx_);
    if (idle_)
        return;  // 幂等

    info_ = info;
    initial_size_ = initial_size;
    max_size_ = std::max(initial_size, max_size);
    max_idle_time_ = max_idle_time;
    connect_timeout_ = connect_timeout;

    idle_ = std::make_shared<BlockingQueue<std::unique_ptr<MySQLConn>>>();

    CreateInitialConnections();
    StartKeepAlive();

    LOG_INFO("[MySQLConnPool] {} initialized ({} / {} connections)", database_, total_.load(), max_size_);
}

void MySQLConnPool::CreateInitialConnections() {
    for (int i = 0; i < initial_size_; ++i) {
        auto conn = TryCreateConnection();
        if (conn && !idle_->Push(std::move(conn)))
            total_.fetch_sub(1, std::memory_order_relaxed);
    }
}

std::unique_ptr<MySQLConn> MySQLConnPool::TryCreateConnection() {
    auto conn = std::make_unique<MySQLConn>(info_);
    if (!conn->Open(std::max(1, connect_timeout_ / 2), 1))
        return nullptr;
    total_.fetch_add(1, std::memory_order_relaxed);
    return conn;
}

// ------------------ 借出与归还 ------------------
std::shared_ptr<MySQLConn> MySQLConnPool::Acquire(std::chrono::milliseconds timeout) {
    if (!idle_)
        return nullptr;

    std::unique_ptr<MySQLConn> conn;
    if (auto idle = idle_->TryPop()) {
        conn = std::move(*idle);
    } else {
        bool mayGrow = false;
        {
            std::lock_guard<std::mutex> lock(pool_mtx_);
            mayGrow = total_.load(std::memory_order_relaxed) < max_size_;
        }
        if (mayGrow)
            conn = TryCreateConnection();
        if (!conn) {
            auto waited = idle_->PopFor(timeout);
            if (!waited) {
                LOG_WARN("[MySQLConnPool] Acquire timed out after {} ms ({} connections busy)", timeout.count(), total_.load());
                return nullptr;
            }
            conn = std::move(*waited);
        }
    }

    if (!conn->IsAlive() && !conn->Ping()) {
        LOG_WARN("[MySQLConnPool] Stale connection, reconnecting");
        conn->Close();
        if (!conn->Open()) {
            total_.fetch_sub(1, std::memory_order_relaxed);
            return nullptr;
        }
    }

    conn->Touch();
    std::weak_ptr<MySQLConnPool> self_weak = weak_from_this();
    return std::shared_ptr<MySQLConn>(conn.release(), [self_weak](MySQLConn* ptr) {
        if (auto self = self_weak.lock()) {
            self->Release(ptr);
        } else {
            delete ptr;  // pool 已销毁，直接释放
        }
    });
}

void MySQLConnPool::Release(MySQLConn* raw) {
    std::unique_ptr<MySQLConn> conn(raw);
    // 持有者异常退出时可能遗留未结束的事务
    if (conn->InTransaction())
        conn->Rollback();

    if (!conn->IsAlive()) {
        conn->Close();
        if (!conn->Open(1, 0)) {
            total_.fetch_sub(1, std::memory_order_relaxed);
            LOG_WARN("[MySQLConnPool] Dropped broken connection ({} remaining)", total_.load());
            return;
        }
    }
    if (!idle_->Push(std::move(conn)))
        total_.fetch_sub(1, std::memory_order_relaxed);  // 池已关闭
}

// ------------------ 停止 ------------------
void MySQLConnPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(pool_mtx_);
        if (!idle_ || idle_->Closed())
            return;
    }
    StopKeepAlive();  // 先停心跳，避免它继续往队列里放连接

    const auto remaining = idle_->Close();
    total_.fetch_sub(static_cast<int>(remaining.size()), std::memory_order_relaxed);
    LOG_INFO("[MySQLConnPool] Shutdown completed for {}", database_);
}

void MySQLConnPool::StartKeepAlive() {
    running_ = true;
    keepalive_thread_ = std::thread(&MySQLConnPool::KeepAliveLoop, this);
}

void MySQLConnPool::StopKeepAlive() {
    {
        std::lock_guard<std::mutex> lock(keepalive_mtx_);
        running_ = false;
    }
    keepalive_cv_.notify_all();
    if (keepalive_thread_.joinable())
        keepalive_thread_.join();
}

void MySQLConnPool::KeepAliveLoop() {
    const auto interval = std::chrono::seconds(std::max(5, max_idle_time_ / 2));

    while (running_) {
        // 只检查空闲连接；借出中的连接由持有者负责。先整批取出，避免栈顶同一条被反复检查
        std::vector<std::unique_ptr<MySQLConn>> batch;
        while (auto idle = idle_->TryPop())
            batch.push_back(std::move(*idle));

        for (auto& conn : batch) {
            const bool recentlyUsed = MySQLConn::Clock::now() - conn->lastUsed() < interval;
            if (!recentlyUsed && !conn->Ping()) {
                LOG_WARN("[KeepAlive] Reconnecting to MySQL...");
                conn->Close();
                if (!conn->Open(1, 0)) {
                    total_.fetch_sub(1, std::memory_order_relaxed);
                    continue;
                }
            }
            if (!idle_->Push(std::move(conn)))
                total_.fetch_sub(1, std::memory_order_relaxed);
        }

        std::unique_lock<std::mutex> lock(keepalive_mtx_);
        keepalive_cv_.wait_for(lock, interval, [this] { return !running_.load(); });
    }
}
