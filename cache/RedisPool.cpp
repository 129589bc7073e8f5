#include "RedisPool.h"

#include <utility>

#include "LogMacros.h"

RedisPool::RedisPool(Options options) : options_(std::move(options)) {
    idle_.reserve(options_.poolSize);
    std::size_t connected = 0;
    for (std::size_t i = 0; i < options_.poolSize; ++i) {
        auto client = std::make_unique<RedisClient>(options_.host, options_.port, options_.password, options_.timeout);
        // 连不上也入池：RedisClient 在下一条命令时重连，Redis 晚于本服务启动也能恢复
        if (client->Connect())
            ++connected;
        idle_.push_back(std::move(client));
    }
    if (connected < options_.poolSize)
        LOG_WARN("[RedisPool] {}:{} only {}/{} clients connected, the rest retry lazily", options_.host, options_.port, connected, options_.poolSize);
    else
        LOG_INFO("[RedisPool] {}:{} ready with {} clients", options_.host, options_.port, connected);
}

RedisPool::~RedisPool() {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.clear();
}

std::shared_ptr<RedisClient> RedisPool::GetClient(std::chrono::milliseconds wait) {
    std::unique_ptr<RedisClient> client;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cond_.wait_for(lock, wait, [this] { return !idle_.empty(); })) {
            LOG_WARN("[RedisPool] No client available within {} ms", wait.count());
            return nullptr;
        }
        client = std::move(idle_.back());
        idle_.pop_back();
    }

    std::weak_ptr<RedisPool> weakSelf = weak_from_this();
    return std::shared_ptr<RedisClient>(client.release(), [weakSelf](RedisClient* ptr) {
        if (auto self = weakSelf.lock())
            self->Release(ptr);
        else
            delete ptr;
    });
}

void RedisPool::Release(RedisClient* client) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.emplace_back(client);
    }
    cond_.notify_one();
}
