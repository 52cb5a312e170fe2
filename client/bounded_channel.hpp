#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

/**
 * @brief A fixed-capacity, thread-safe FIFO with only non-blocking operations.
 *
 * Producers drop an item when the channel is full, consumers get nothing
 * when it is empty. The internal lock is held only for the push/pop itself.
 */
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(size_t capacity) : capacity_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("Channel capacity must be greater than 0");
        }
    }

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    // Returns false (and drops the item) if the channel is full.
    bool try_send(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.size() >= capacity_) {
            return false;
        }
        items_.push_back(std::move(item));
        return true;
    }

    std::optional<T> try_receive() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    std::deque<T> items_;
    mutable std::mutex mutex_;
};
