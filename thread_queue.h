#pragma once

#include <deque>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>

// Unbounded thread-safe FIFO. Waiters can take the oldest item or the oldest
// item matching a predicate; unmatched items stay queued for other waiters.
template<typename T>
class ThreadQueue {
public:
    void push(const T& item) {
        std::lock_guard<std::mutex> lock(mutex);
        queue.push_back(item);
        cv.notify_all();
    }

    void push(T&& item) {
        std::lock_guard<std::mutex> lock(mutex);
        queue.push_back(std::move(item));
        cv.notify_all();
    }

    std::optional<T> pop() {
        std::lock_guard<std::mutex> lock(mutex);
        if (queue.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue.front());
        queue.pop_front();
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
        queue.pop_front();
        return item;
    }

    // Wait for the first item satisfying match. Returns nullopt on timeout,
    // or once the queue is closed and holds no matching item.
    template<typename Match, typename Rep, typename Period>
    std::optional<T> wait_for_and_take(Match match, const std::chrono::duration<Rep, Period>& timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::unique_lock<std::mutex> lock(mutex);

        while (true) {
            for (auto it = queue.begin(); it != queue.end(); ++it) {
                if (match(*it)) {
                    T item = std::move(*it);
                    queue.erase(it);
                    return item;
                }
            }
            if (closed) {
                return std::nullopt;
            }
            if (cv.wait_until(lock, deadline) == std::cv_status::timeout) {
                // One last scan: an item may have landed right at the deadline
                for (auto it = queue.begin(); it != queue.end(); ++it) {
                    if (match(*it)) {
                        T item = std::move(*it);
                        queue.erase(it);
                        return item;
                    }
                }
                return std::nullopt;
            }
        }
    }

    // Drop every item satisfying match
    template<typename Match>
    size_t remove_if(Match match) {
        std::lock_guard<std::mutex> lock(mutex);
        size_t before = queue.size();
        for (auto it = queue.begin(); it != queue.end();) {
            if (match(*it)) {
                it = queue.erase(it);
            } else {
                ++it;
            }
        }
        return before - queue.size();
    }

    // Wake all waiters; no further items are expected
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

    void clear() {
        std::lock_guard<std::mutex> lock(mutex);
        queue.clear();
    }

private:
    std::deque<T> queue;
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool closed = false;
};
