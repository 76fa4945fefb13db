#ifndef EVENT_QUEUE_HPP
#define EVENT_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <vector>

// FIFO handoff between event producers and the single dispatch worker.
// Once shut down it refuses new items but still hands out queued ones.
template<typename T>
class EventQueue {
private:
    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutdown_{false};

public:
    EventQueue() = default;

    // Non-copyable, non-movable
    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    // Add item to queue (thread-safe). False once shut down.
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_.load()) {
                return false;
            }
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    // Wait and retrieve item (blocks until available or shutdown)
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] {
            return !queue_.empty() || shutdown_.load();
        });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    // Non-blocking try to retrieve
    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    // Take everything queued, in order
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> items(std::make_move_iterator(queue_.begin()),
                             std::make_move_iterator(queue_.end()));
        queue_.clear();
        return items;
    }

    // Signal shutdown - unblocks waiting threads
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_.store(true);
        }
        cv_.notify_all();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool isShutdown() const {
        return shutdown_.load();
    }
};

#endif // EVENT_QUEUE_HPP
