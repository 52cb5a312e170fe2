#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <thread>

#include "admission_queue.hpp"
#include "shutdown_signal.hpp"

/**
 * @brief Linear warm-up: the admission probability grows from 0 to 1 over
 * the ramp-up window. A zero-length window is done from the start.
 */
class RampSchedule {
public:
    explicit RampSchedule(std::chrono::milliseconds rampup) : rampup_(rampup) {}

    bool done(std::chrono::steady_clock::duration elapsed) const {
        return rampup_.count() <= 0 || elapsed > rampup_;
    }

    // Whole percent of the window elapsed, clamped to [0, 100].
    int percent_elapsed(std::chrono::steady_clock::duration elapsed) const;

    // One random draw: admitted with probability percent_elapsed / 100.
    bool admit(std::chrono::steady_clock::duration elapsed, std::mt19937& gen) const;

private:
    std::chrono::milliseconds rampup_;
};

struct DispatcherStats {
    long long ticks = 0;
    long long skipped = 0;   // not admitted during ramp-up
    long long admitted = 0;  // handed to an idle worker
    long long dropped = 0;   // admitted, but no worker was free
};

/**
 * @brief Emits admission tokens for one workload at a fixed rate.
 *
 * A ticker fires every 1s / rate. During ramp-up each tick is admitted
 * with the RampSchedule probability; admitted ticks are offered to the
 * AdmissionQueue without blocking and dropped if every worker is busy.
 */
class RateDispatcher {
public:
    RateDispatcher(std::string name, int rate, std::chrono::milliseconds rampup,
                   AdmissionQueue& admission, ShutdownSignal& shutdown,
                   std::optional<uint32_t> seed = std::nullopt);
    ~RateDispatcher();

    RateDispatcher(const RateDispatcher&) = delete;
    RateDispatcher& operator=(const RateDispatcher&) = delete;

    void start();
    void join();

    // Runs the ticker loop on the calling thread until shutdown.
    void run();

    DispatcherStats stats() const;

    // One ramp-up draw from this dispatcher's generator, as run() makes per tick.
    bool ramp_admit(std::chrono::steady_clock::duration elapsed) { return ramp_.admit(elapsed, gen_); }

    std::chrono::nanoseconds period() const { return period_; }

private:
    std::string name_;
    int rate_;
    std::chrono::nanoseconds period_;
    RampSchedule ramp_;
    AdmissionQueue& admission_;
    ShutdownSignal& shutdown_;
    std::mt19937 gen_;
    std::thread thread_;

    std::atomic<long long> ticks_{0};
    std::atomic<long long> skipped_{0};
    std::atomic<long long> admitted_{0};
    std::atomic<long long> dropped_{0};
};
