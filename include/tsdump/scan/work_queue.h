#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace tsdump {
namespace scan {

/**
 * @brief Mutex-guarded FIFO that is filled once, closed, then drained.
 *
 * Each pushed item is handed to exactly one try_pop caller. Once closed
 * and empty, try_pop returns std::nullopt forever, which is the consumers'
 * signal to exit.
 *
 * @tparam T Type of element stored in the queue.
 */
template<typename T>
class WorkQueue {
public:
    WorkQueue() = default;

    // Non-copyable, non-movable
    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    /**
     * @brief Adds an item.
     * @return false if the queue is already closed
     */
    bool push(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        ++pushed_;
        return true;
    }

    /** @brief Refuses further pushes. */
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

    /**
     * @brief Claims the front item.
     * @return the item and its 1-based claim number, or std::nullopt when empty
     */
    std::optional<std::pair<T, size_t>> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return std::make_pair(std::move(item), ++claimed_);
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    /** @brief Items ever pushed. */
    size_t total() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pushed_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<T> items_;
    bool closed_ = false;
    size_t pushed_ = 0;
    size_t claimed_ = 0;
};

} // namespace scan
} // namespace tsdump
