#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>

/// @brief Blocking FIFO shared between a producer and a consumer thread
/// Once closed, push() is ignored and waiting consumers wake with nullopt.
template<typename T>
class ThreadQueue {
public:
    void push(const T& item) {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return;
        }
        queue.push(item);
        cv.notify_one();
    }

    void push(T&& item) {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return;
        }
        queue.push(std::move(item));
        cv.notify_one();
    }

    std::optional<T> pop() {
        std::lock_guard<std::mutex> lock(mutex);
        if (queue.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue.front());
        queue.pop();
        return item;
    }

    template<typename Rep, typename Period>
    std::optional<T> wait_for_and_pop(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        if (!cv.wait_for(lock, timeout, [this] { return !queue.empty() || closed; })) {
            return std::nullopt;
        }
        if (queue.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue.front());
        queue.pop();
        return item;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
        cv.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex);
        return queue.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return queue.size();
    }

private:
    std::queue<T> queue;
    bool closed = false;
    mutable std::mutex mutex;
    std::condition_variable cv;
};
