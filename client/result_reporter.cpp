#include "result_reporter.hpp"

#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

#include "utils.h"

using Clock = std::chrono::steady_clock;

ResultReporter::ResultReporter(std::string name, std::chrono::milliseconds interval, ShutdownSignal& shutdown)
    : name_(std::move(name)), interval_(interval), shutdown_(shutdown)
{
    if (interval.count() <= 0) {
        throw std::invalid_argument("Report interval must be greater than 0");
    }
}

ResultReporter::~ResultReporter() {
    join();
}

bool ResultReporter::submit(Outcome outcome) {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    if (shutdown_.triggered()) {
        return false;
    }
    inbox_.push_back(std::move(outcome));
    accepted_++;
    return true;
}

void ResultReporter::start() {
    thread_ = std::thread(&ResultReporter::run, this);
}

void ResultReporter::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ResultReporter::run() {
    auto window_start = Clock::now();
    auto next_tick = window_start + interval_;

    while (!shutdown_.wait_until(next_tick)) {
        auto now = Clock::now();
        flush(now - window_start);
        window_start = now;
        next_tick += interval_;
        while (next_tick <= now) {
            next_tick += interval_;
        }
    }
}

void ResultReporter::flush(std::chrono::duration<double> interval) {
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        window_.swap(inbox_);
    }

    IntervalSummary summary = summarize(window_, interval);
    for (const auto& line : format(name_, summary)) {
        log_line(line);
    }
    window_.clear();
}

IntervalSummary ResultReporter::summarize(std::vector<Outcome>& window, std::chrono::duration<double> interval) {
    IntervalSummary s;
    s.requests = window.size();
    if (interval.count() > 0) {
        s.throughput = static_cast<double>(window.size()) / interval.count();
    }
    if (window.empty()) {
        return s;
    }

    std::map<std::string, int> errors;
    Clock::duration total{0};
    for (const auto& o : window) {
        total += o.elapsed;
        if (o.error) {
            errors[o.error->message]++;
            s.errors++;
        }
    }

    std::sort(window.begin(), window.end(),
              [](const Outcome& a, const Outcome& b) { return a.elapsed < b.elapsed; });

    auto to_ms = [](Clock::duration d) {
        return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(d).count());
    };
    s.avg_ms = to_ms(total / static_cast<long long>(window.size()));
    s.p99_ms = to_ms(window[window.size() * 99 / 100].elapsed);
    s.error_counts.assign(errors.begin(), errors.end());
    return s;
}

std::vector<std::string> ResultReporter::format(const std::string& name, const IntervalSummary& summary) {
    std::vector<std::string> lines;

    std::ostringstream ss;
    ss << name << ": " << std::fixed << std::setprecision(1) << summary.throughput << " req/s";
    if (summary.requests > 0) {
        ss << ", avg " << summary.avg_ms << "ms, p99 " << summary.p99_ms << "ms, "
           << summary.errors << " errors";
    }
    lines.push_back(ss.str());

    for (const auto& e : summary.error_counts) {
        if (e.second == 1) {
            lines.push_back(name + ": " + e.first);
        } else {
            lines.push_back(name + ": " + e.first + " (" + std::to_string(e.second) + " times)");
        }
    }
    return lines;
}
