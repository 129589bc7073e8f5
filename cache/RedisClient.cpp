#include "RedisClient.h"

#include <utility>

#include "LogMacros.h"

namespace {
bool IsOk(const redisReply* r) {
    return r && r->type == REDIS_REPLY_STATUS && std::string_view(r->str, r->len) == "OK";
}
}  // namespace

RedisClient::RedisClient(std::string host, int port, std::string password, std::chrono::milliseconds timeout) :
    host_(std::move(host)), port_(port), password_(std::move(password)) {
    timeout_.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    timeout_.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
}

RedisClient::~RedisClient() noexcept {
    Close();
}

bool RedisClient::Connect() {
    Close();
    context_ = redisConnectWithTimeout(host_.c_str(), port_, timeout_);
    if (context_ == nullptr) {
        LOG_ERROR("[RedisClient] Out of memory connecting to {}:{}", host_, port_);
        return false;
    }
    if (context_->err) {
        LOG_WARN("[RedisClient] Connect to {}:{} failed: {}", host_, port_, context_->errstr);
        Close();
        return false;
    }
    redisSetTimeout(context_, timeout_);

    if (!password_.empty() && !IsOk(command({"AUTH", password_}).get())) {
        LOG_ERROR("[RedisClient] AUTH rejected by {}:{}", host_, port_);
        Close();
        return false;
    }
    LOG_INFO("[RedisClient] Connected to {}:{}", host_, port_);
    return true;
}

void RedisClient::Close() noexcept {
    if (context_) {
        redisFree(context_);
        context_ = nullptr;
    }
}

RedisClient::Reply RedisClient::command(const std::vector<std::string_view>& args) {
    if (!IsConnected() && !Connect())
        return nullptr;

    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (auto a : args) {
        argv.push_back(a.data());
        argvlen.push_back(a.size());
    }

    Reply reply(static_cast<redisReply*>(redisCommandArgv(context_, static_cast<int>(argv.size()), argv.data(), argvlen.data())));
    if (!reply) {
        LOG_WARN("[RedisClient] {} on {}:{} failed: {}", args.front(), host_, port_, context_->errstr);
        Close();
    } else if (reply->type == REDIS_REPLY_ERROR) {
        LOG_WARN("[RedisClient] {} rejected: {}", args.front(), std::string_view(reply->str, reply->len));
    }
    return reply;
}

bool RedisClient::Get(const std::string& key, std::string& value) {
    Reply reply = command({"GET", key});
    if (!reply || reply->type != REDIS_REPLY_STRING)
        return false;
    value.assign(reply->str, reply->len);
    return true;
}

bool RedisClient::SetEx(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    if (ttl.count() <= 0)
        return IsOk(command({"SET", key, value}).get());
    const std::string seconds = std::to_string(ttl.count());
    return IsOk(command({"SET", key, value, "EX", seconds}).get());
}

bool RedisClient::Del(const std::string& key) {
    return Del(std::vector<std::string>{key});
}

bool RedisClient::Del(const std::vector<std::string>& keys) {
    if (keys.empty())
        return true;
    std::vector<std::string_view> args{"DEL"};
    args.insert(args.end(), keys.begin(), keys.end());
    Reply reply = command(args);
    return reply && reply->type == REDIS_REPLY_INTEGER;
}
