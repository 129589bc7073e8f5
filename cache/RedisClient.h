#pragma once

#include <hiredis/hiredis.h>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "NonCopyable.h"

// 单连接同步 Redis 客户端。线程不安全，由 RedisPool 保证同一时刻只有一个持有者。
// 命令失败（连接断开、超时）时释放 context，下一次调用自动重连。
class RedisClient : NonCopyable {
public:
    RedisClient(std::string host, int port, std::string password, std::chrono::milliseconds timeout);
    ~RedisClient() noexcept;

    bool Connect();
    void Close() noexcept;
    bool IsConnected() const noexcept { return context_ != nullptr && context_->err == 0; }

    // 键不存在返回 false
    bool Get(const std::string& key, std::string& value);
    // SET key value [EX ttl]；ttl <= 0 时不设置过期
    bool SetEx(const std::string& key, const std::string& value, std::chrono::seconds ttl);
    // 键不存在也算成功
    bool Del(const std::string& key);
    bool Del(const std::vector<std::string>& keys);

private:
    struct ReplyDeleter {
        void operator()(redisReply* r) const noexcept { freeReplyObject(r); }
    };
    using Reply = std::unique_ptr<redisReply, ReplyDeleter>;

    Reply command(const std::vector<std::string_view>& args);

    std::string host_;
    int port_;
    std::string password_;
    struct timeval timeout_ {};
    redisContext* context_ = nullptr;
};
