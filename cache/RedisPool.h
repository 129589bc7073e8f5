#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "RedisClient.h"

// 固定大小的 Redis 连接池。借出的 shared_ptr 析构时归还；池先于借出者销毁时直接释放连接。
class RedisPool : public std::enable_shared_from_this<RedisPool> {
public:
    struct Options {
        std::string host = "127.0.0.1";
        int port = 6379;
        std::string password;
        std::size_t poolSize = 4;
        std::chrono::milliseconds timeout{1000};
    };

    explicit RedisPool(Options options);
    ~RedisPool();

    // 等待 wait 仍无空闲客户端时返回 nullptr，调用方按缓存不可用处理
    std::shared_ptr<RedisClient> GetClient(std::chrono::milliseconds wait = std::chrono::milliseconds(200));

    const Options& options() const noexcept { return options_; }

private:
    void Release(RedisClient* client);

    Options options_;
    std::mutex mutex_;
    std::condition_variable cond_;
    std::vector<std::unique_ptr<RedisClient>> idle_;
};
