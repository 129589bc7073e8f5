#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "NonCopyable.h"

// 连接池的空闲队列：后进先出，最近归还的连接最先被借出（保持热连接）。
// Close() 之后 Push 被拒绝，等待中的 PopFor 立即返回。
template <typename T>
class BlockingQueue : NonCopyable {
public:
    // 队列已关闭时返回 false，元素由调用方处理
    bool Push(T value) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (closed_)
                return false;
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> TryPop() {
        std::lock_guard<std::mutex> lock(mtx_);
        return takeLocked();
    }

    template <typename Rep, typename Period>
    std::optional<T> PopFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        if (closed_)
            return std::nullopt;
        return takeLocked();
    }

    // 关闭并取走剩余元素
    std::deque<T> Close() {
        std::deque<T> rest;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            closed_ = true;
            rest.swap(items_);
        }
        cv_.notify_all();
        return rest;
    }

    bool Closed() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return closed_;
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return items_.size();
    }

private:
    std::optional<T> takeLocked() {
        if (items_.empty())
            return std::nullopt;
        std::optional<T> out(std::move(items_.back()));
        items_.pop_back();
        return out;
    }

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};
