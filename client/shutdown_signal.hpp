#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * @brief One-shot broadcast used to stop every dispatcher, worker and
 * reporter of a run. Observed cooperatively; nothing is interrupted.
 */
class ShutdownSignal {
public:
    void trigger() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            triggered_.store(true);
        }
        condition_.notify_all();
    }

    bool triggered() const { return triggered_.load(); }

    /**
     * @brief Sleeps until the deadline or until shutdown, whichever comes first.
     * @return true if shutdown was triggered.
     */
    bool wait_until(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        return condition_.wait_until(lock, deadline, [this] { return triggered_.load(); });
    }

    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) {
        return wait_until(std::chrono::steady_clock::now() + timeout);
    }

private:
    std::atomic<bool> triggered_{false};
    std::mutex mutex_;
    std::condition_variable condition_;
};
