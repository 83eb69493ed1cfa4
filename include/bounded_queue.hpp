/*
Bounded multi-producer/multi-consumer queue.
1. Back-pressure: producers block while the queue is full.
2. Producers may give up through a stop token, so shutdown never hangs on a full queue.
3. Batch draining: once a producer calls finish(), consumers that find the queue empty
   return instead of waiting. restart() re-arms the queue for the next batch.
4. close() is final: pushes fail, consumers drain what is left and then return.
*/

#ifndef SCAN_NOTIFIER_BOUNDED_QUEUE_HPP
#define SCAN_NOTIFIER_BOUNDED_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace scan_notifier {

template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity)
        : m_capacity(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Blocks while the queue is full. Fails if the queue is closed or the token is stopped first.
    bool push(T item, std::stop_token token = {}) {
        std::unique_lock<std::mutex> lock(m_mutex);

        bool hasRoom = m_notFull.wait(lock, token, [this] {
            return m_items.size() < m_capacity || m_closed;
        });

        if (!hasRoom || m_closed) {
            return false;
        }

        m_items.push_back(std::move(item));
        m_notEmpty.notify_one();
        return true;
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return takeFront();
    }

    // Blocks until an item is available. Returns nothing once the queue is empty and
    // either finished or closed.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notEmpty.wait(lock, [this] {
            return !m_items.empty() || m_finished || m_closed;
        });
        return takeFront();
    }

    std::optional<T> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notEmpty.wait_for(lock, timeout, [this] {
            return !m_items.empty() || m_finished || m_closed;
        });
        return takeFront();
    }

    // No more items for the current batch
    void finish() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_finished = true;
        m_notEmpty.notify_all();
    }

    void restart() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_finished = false;
    }

    void close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        m_notEmpty.notify_all();
        m_notFull.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    // Closed and nothing left to consume
    bool drained() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed && m_items.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    std::size_t capacity() const { return m_capacity; }

private:
    // Caller holds m_mutex
    std::optional<T> takeFront() {
        if (m_items.empty()) {
            return std::nullopt;
        }
        T item = std::move(m_items.front());
        m_items.pop_front();
        m_notFull.notify_one();
        return item;
    }

    mutable std::mutex m_mutex;
    std::condition_variable_any m_notEmpty;
    std::condition_variable_any m_notFull;
    std::deque<T> m_items;
    const std::size_t m_capacity;
    bool m_finished{false};
    bool m_closed{false};
};

}  // namespace scan_notifier

#endif  // SCAN_NOTIFIER_BOUNDED_QUEUE_HPP
