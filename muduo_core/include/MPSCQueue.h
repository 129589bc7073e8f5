#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <utility>

#include "NonCopyable.h"

/**
 * @brief MPSCAtomicQueue：多生产者单消费者无锁链表队列（Vyukov）
 *
 * enqueue 可在任意线程调用；dequeue / drain 只能由唯一的消费者线程调用。
 * head_ 始终指向一个已被消费的哨兵节点。
 */
template <typename T>
class MPSCAtomicQueue : NonCopyable {
public:
    MPSCAtomicQueue() : head_(new Node()) { tail_.store(head_, std::memory_order_relaxed); }

    ~MPSCAtomicQueue() {
        while (Node* next = head_->next.load(std::memory_order_relaxed)) {
            delete head_;
            head_ = next;
        }
        delete head_;
    }

    void enqueue(T&& value) {
        Node* node = new Node(std::move(value));
        Node* prev = tail_.exchange(node, std::memory_order_acq_rel);
        prev->next.store(node, std::memory_order_release);
    }

    bool dequeue(T& out) {
        Node* next = head_->next.load(std::memory_order_acquire);
        if (!next)
            return false;
        out = std::move(next->value);
        delete head_;
        head_ = next;
        return true;
    }

    // 批量取出，返回取出的条数
    template <typename F>
    std::size_t drain(F&& fn, std::size_t maxItems = SIZE_MAX) {
        std::size_t n = 0;
        T item;
        while (n < maxItems && dequeue(item)) {
            fn(std::move(item));
            ++n;
        }
        return n;
    }

private:
    struct Node {
        Node() = default;
        explicit Node(T&& v) : value(std::move(v)) {}

        T value{};
        std::atomic<Node*> next{nullptr};
    };

    Node* head_;  // 消费者独占
    std::atomic<Node*> tail_;  // 生产者竞争
};
