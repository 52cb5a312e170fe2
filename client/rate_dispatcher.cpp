#include "rate_dispatcher.hpp"

#include <stdexcept>

#include "utils.h"

using Clock = std::chrono::steady_clock;

int RampSchedule::percent_elapsed(Clock::duration elapsed) const {
    if (done(elapsed)) {
        return 100;
    }
    if (elapsed.count() <= 0) {
        return 0;
    }
    return static_cast<int>(elapsed * 100 / rampup_);
}

bool RampSchedule::admit(Clock::duration elapsed, std::mt19937& gen) const {
    std::uniform_int_distribution<> draw(0, 99);
    return draw(gen) < percent_elapsed(elapsed);
}

RateDispatcher::RateDispatcher(std::string name, int rate, std::chrono::milliseconds rampup,
                               AdmissionQueue& admission, ShutdownSignal& shutdown,
                               std::optional<uint32_t> seed)
    : name_(std::move(name)), rate_(rate), period_(0), ramp_(rampup),
      admission_(admission), shutdown_(shutdown)
{
    if (rate <= 0) {
        throw std::invalid_argument("Request rate for '" + name_ + "' must be greater than 0");
    }
    period_ = std::chrono::nanoseconds(std::chrono::seconds(1)) / rate;
    if (period_.count() == 0) {
        period_ = std::chrono::nanoseconds(1);
    }

    if (seed) {
        gen_.seed(*seed);
    } else {
        gen_.seed(std::random_device{}());
    }
}

RateDispatcher::~RateDispatcher() {
    join();
}

void RateDispatcher::start() {
    thread_ = std::thread(&RateDispatcher::run, this);
}

void RateDispatcher::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void RateDispatcher::run() {
    log_line(name_ + ": starting load test with " + std::to_string(rate_) + " requests per second");

    const auto start = Clock::now();
    auto next_tick = start + period_;
    bool rampup_done = ramp_.done(Clock::duration::zero());

    while (!shutdown_.wait_until(next_tick)) {
        auto now = Clock::now();
        // Like a ticker, skip ticks that were missed rather than bursting.
        while (next_tick <= now) {
            next_tick += period_;
        }
        ticks_++;

        if (!rampup_done) {
            auto elapsed = now - start;
            if (ramp_.done(elapsed)) {
                rampup_done = true;
                log_line(name_ + ": rampup done");
            } else if (!ramp_admit(elapsed)) {
                skipped_++;
                continue;
            }
        }

        if (admission_.try_offer()) {
            admitted_++;
        } else {
            dropped_++;
        }
    }
}

DispatcherStats RateDispatcher::stats() const {
    DispatcherStats s;
    s.ticks = ticks_.load();
    s.skipped = skipped_.load();
    s.admitted = admitted_.load();
    s.dropped = dropped_.load();
    return s;
}
