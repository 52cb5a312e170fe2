#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include "admission_queue.hpp"
#include "http_client.hpp"
#include "result_reporter.hpp"
#include "workload.hpp"

/**
 * @brief A fixed number of threads executing one workload.
 *
 * Each thread owns a clone of the workload, its own HTTP client and its
 * own random generator. It waits for an admission token, times one
 * execute() call and submits the Outcome to the reporter. Closing the
 * admission queue stops idle threads at once; a busy thread finishes its
 * current request first.
 */
class WorkerPool {
public:
    /**
     * @param workload_template Cloned once per thread.
     * @param thread_count      Number of worker threads.
     * @param seed              Base seed; thread i uses seed + i. Unset seeds from std::random_device.
     */
    WorkerPool(const IWorkload& workload_template, int thread_count, ClientOptions options,
               AdmissionQueue& admission, ResultReporter& reporter,
               std::optional<uint32_t> seed = std::nullopt);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();

    // Waits for every thread; call after the admission queue is closed.
    void join();

    size_t size() const { return workloads_.size(); }

private:
    void worker(IWorkload& workload, std::optional<uint32_t> seed);

    std::vector<std::unique_ptr<IWorkload>> workloads_;
    ClientOptions options_;
    AdmissionQueue& admission_;
    ResultReporter& reporter_;
    std::optional<uint32_t> seed_;
    std::vector<std::thread> threads_;
};
