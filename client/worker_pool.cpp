#include "worker_pool.hpp"

#include <chrono>
#include <functional>
#include <random>
#include <stdexcept>

WorkerPool::WorkerPool(const IWorkload& workload_template, int thread_count, ClientOptions options,
                       AdmissionQueue& admission, ResultReporter& reporter,
                       std::optional<uint32_t> seed)
    : options_(std::move(options)), admission_(admission), reporter_(reporter), seed_(seed)
{
    if (thread_count <= 0) {
        throw std::invalid_argument("Worker count must be greater than 0");
    }
    workloads_.reserve(thread_count);
    for (int i = 0; i < thread_count; ++i) {
        workloads_.push_back(workload_template.clone());
    }
}

WorkerPool::~WorkerPool() {
    admission_.close();
    join();
}

void WorkerPool::start() {
    threads_.reserve(workloads_.size());
    for (size_t i = 0; i < workloads_.size(); ++i) {
        std::optional<uint32_t> thread_seed;
        if (seed_) {
            thread_seed = *seed_ + static_cast<uint32_t>(i);
        }
        threads_.emplace_back(&WorkerPool::worker, this, std::ref(*workloads_[i]), thread_seed);
    }
}

void WorkerPool::join() {
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void WorkerPool::worker(IWorkload& workload, std::optional<uint32_t> seed) {
    // Each thread gets its own persistent client and random number generator
    httplib::Client cli(base_url(options_.host));
    configure_client(cli, options_);

    std::mt19937 gen;
    if (seed) {
        gen.seed(*seed);
    } else {
        gen.seed(std::random_device{}());
    }

    while (admission_.take()) {
        auto start_time = std::chrono::steady_clock::now();

        Outcome outcome;
        try {
            outcome.error = workload.execute(cli, gen);
        } catch (const std::exception& e) {
            outcome.error = RequestError::transport(e.what());
        }

        outcome.elapsed = std::chrono::steady_clock::now() - start_time;

        // Dropped by the reporter if shutdown happened while in flight.
        reporter_.submit(std::move(outcome));
    }
}
