#include "AsyncFileSink.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>

AsyncFileSink::AsyncFileSink(const std::string& path) : AsyncFileSink(path, Options{}) {}

AsyncFileSink::AsyncFileSink(const std::string& path, Options options) : options_(options) {
    fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0)
        throw std::runtime_error("cannot open " + path + ": " + std::strerror(errno));
    running_.store(true);
    worker_ = std::thread([this] { run(); });
}

AsyncFileSink::~AsyncFileSink() {
    stop();
}

void AsyncFileSink::submit(std::string&& line) {
    queue_.enqueue(std::move(line));
    if (!pending_.exchange(true)) {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        wakeCond_.notify_one();
    }
}

void AsyncFileSink::stop() {
    if (!running_.exchange(false))
        return;
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        wakeCond_.notify_one();
    }
    if (worker_.joinable())
        worker_.join();
    ::close(fd_);
    fd_ = -1;
}

void AsyncFileSink::flushBatch(std::string& batch) {
    const char* p = batch.data();
    std::size_t left = batch.size();
    while (left > 0) {
        const ssize_t n = ::write(fd_, p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            break;  // 写失败丢弃本批，不回压业务线程
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
    batch.clear();
}

void AsyncFileSink::syncToDisk() {
    if (options_.dataSyncOnly)
        ::fdatasync(fd_);
    else
        ::fsync(fd_);
}

void AsyncFileSink::run() {
    const auto interval = std::chrono::milliseconds(options_.syncIntervalMs);
    auto deadline = std::chrono::steady_clock::now() + interval;
    std::size_t unsynced = 0;
    std::string batch;
    batch.reserve(options_.batchBytes);

    auto take = [&](std::string&& line) {
        unsynced += line.size();
        batch.append(line);
        if (batch.size() >= options_.batchBytes)
            flushBatch(batch);
    };

    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wakeMutex_);
            wakeCond_.wait_until(lock, deadline, [this] { return pending_.load() || !running_.load(); });
        }
        pending_.store(false);
        queue_.drain(take);

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline || unsynced >= options_.syncBytes) {
            flushBatch(batch);
            syncToDisk();
            unsynced = 0;
            deadline = now + interval;
        }
    }

    // stop() 之后的收尾：生产者可能仍在入队
    queue_.drain(take);
    flushBatch(batch);
    syncToDisk();
}
