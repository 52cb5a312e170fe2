#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

/**
 * @brief Hand-off point between a rate dispatcher and its worker pool.
 *
 * A token is accepted only while some worker is idle-waiting for one, so a
 * dispatcher never builds up a backlog: when every worker is busy the offer
 * is refused and the tick is lost.
 */
class AdmissionQueue {
public:
    AdmissionQueue() = default;

    AdmissionQueue(const AdmissionQueue&) = delete;
    AdmissionQueue& operator=(const AdmissionQueue&) = delete;

    /**
     * @brief Offers one admission token without blocking.
     * @return true if an idle worker will pick the token up.
     */
    bool try_offer() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_ || pending_tokens_ >= idle_workers_) {
            return false;
        }
        pending_tokens_++;

        lock.unlock();
        condition_.notify_one();
        return true;
    }

    /**
     * @brief Blocks the calling worker until a token arrives or the queue
     * is closed.
     * @return false once closed; any pending tokens are discarded.
     */
    bool take() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_workers_++;
        condition_.wait(lock, [this]() { return closed_ || pending_tokens_ > 0; });
        idle_workers_--;

        if (closed_) {
            return false;
        }
        pending_tokens_--;
        return true;
    }

    // Wakes every waiting worker; take() returns false from now on.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            pending_tokens_ = 0;
        }
        condition_.notify_all();
    }

    size_t idle_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return idle_workers_;
    }

private:
    size_t idle_workers_ = 0;
    size_t pending_tokens_ = 0;
    bool closed_ = false;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
};
