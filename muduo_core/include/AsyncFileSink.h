#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

#include "MPSCQueue.h"
#include "NonCopyable.h"

// 异步日志落盘：业务线程 submit 入无锁队列，后台线程批量 write 并周期性 fdatasync
class AsyncFileSink : NonCopyable {
public:
    struct Options {
        std::size_t batchBytes = 64 * 1024;  // 攒够即写
        std::size_t syncBytes = 4 * 1024 * 1024;  // 未同步字节数上限
        int syncIntervalMs = 1000;
        bool dataSyncOnly = true;  // fdatasync 还是 fsync
    };

    // 文件打不开时抛 std::runtime_error
    explicit AsyncFileSink(const std::string& path);
    AsyncFileSink(const std::string& path, Options options);
    ~AsyncFileSink();

    void submit(std::string&& line);

    // 幂等；返回前保证队列中的日志已写盘
    void stop();

private:
    void run();
    void flushBatch(std::string& batch);
    void syncToDisk();

    int fd_ = -1;
    Options options_;
    std::atomic<bool> running_{false};
    std::atomic<bool> pending_{false};
    MPSCAtomicQueue<std::string> queue_;
    std::mutex wakeMutex_;
    std::condition_variable wakeCond_;
    std::thread worker_;
};
