#pragma once

#include <queue>
#include <mutex>
#include <optional>
#include <condition_variable>

template <typename T>
class ThreadSafeQueue {
public:
    // Add item to queue
    void enqueue(T item) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (stop_) return;
            queue_.push(std::move(item));
        }
        cv_.notify_one();
    }

    // Block until an item is available; empty once the queue is stopped
    std::optional<T> dequeue() {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
        if (stop_) return std::nullopt;

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    // Stop the queue and wake every waiter
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            stop_ = true;
        }
        cv_.notify_all();
    }

private:
    std::queue<T> queue_;                     // Pending items
    std::mutex mtx_;                          // Mutex for queue protection
    std::condition_variable cv_;              // Condition variable for synchronization
    bool stop_ = false;                       // Stop flag
};
