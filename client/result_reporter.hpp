#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "outcome.hpp"
#include "shutdown_signal.hpp"

struct IntervalSummary {
    size_t requests = 0;
    double throughput = 0.0;  // requests per second
    long long avg_ms = 0;
    long long p99_ms = 0;
    size_t errors = 0;
    // Distinct error messages with their occurrence counts, sorted by message.
    std::vector<std::pair<std::string, int>> error_counts;
};

/**
 * @brief Aggregates the Outcomes of one workload and logs a summary every
 * report interval.
 *
 * Workers hand Outcomes over with submit(); the reporter thread swaps them
 * into its private window on each tick, logs the summary and starts a new
 * window. On shutdown the thread exits without a final flush, and any
 * Outcome submitted afterwards is discarded.
 */
class ResultReporter {
public:
    ResultReporter(std::string name, std::chrono::milliseconds interval, ShutdownSignal& shutdown);
    ~ResultReporter();

    ResultReporter(const ResultReporter&) = delete;
    ResultReporter& operator=(const ResultReporter&) = delete;

    /**
     * @brief Hands one Outcome to the reporter.
     * @return false if shutdown has been signalled and the Outcome was dropped.
     */
    bool submit(Outcome outcome);

    void start();
    void join();

    // Runs the reporting loop on the calling thread until shutdown.
    void run();

    // Outcomes accepted so far (including the current, unflushed window).
    long long accepted() const { return accepted_.load(); }

    /**
     * @brief Computes throughput, mean, p99 and the error histogram.
     * Sorts window by elapsed time in place.
     */
    static IntervalSummary summarize(std::vector<Outcome>& window, std::chrono::duration<double> interval);

    // Summary line followed by one line per distinct error message.
    static std::vector<std::string> format(const std::string& name, const IntervalSummary& summary);

private:
    void flush(std::chrono::duration<double> interval);

    std::string name_;
    std::chrono::milliseconds interval_;
    ShutdownSignal& shutdown_;
    std::thread thread_;

    std::mutex inbox_mutex_;
    std::vector<Outcome> inbox_;
    std::vector<Outcome> window_;
    std::atomic<long long> accepted_{0};
};
