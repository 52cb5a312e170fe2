#include "result_reporter.hpp"

#include <thread>

#include <gtest/gtest.h>

using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

Outcome ok(int ms) {
    return Outcome{milliseconds(ms), std::nullopt};
}

Outcome failed(int ms, const std::string& msg) {
    return Outcome{milliseconds(ms), RequestError{ErrorKind::Transport, 0, msg}};
}

} // namespace

// ── summarize ─────────────────────────────────────────────────────────────────

TEST(Summarize, SingleOutcome) {
    std::vector<Outcome> window{ok(42)};
    auto s = ResultReporter::summarize(window, seconds(10));
    EXPECT_EQ(s.requests, 1u);
    EXPECT_DOUBLE_EQ(s.throughput, 0.1);
    EXPECT_EQ(s.avg_ms, 42);
    EXPECT_EQ(s.p99_ms, 42);
    EXPECT_EQ(s.errors, 0u);
}

TEST(Summarize, P99IsTheOutlierInAHundred) {
    std::vector<Outcome> window;
    for (int i = 0; i < 99; ++i) window.push_back(ok(10));
    window.insert(window.begin() + 37, ok(5000));

    auto s = ResultReporter::summarize(window, seconds(10));
    EXPECT_EQ(s.requests, 100u);
    EXPECT_DOUBLE_EQ(s.throughput, 10.0);
    EXPECT_EQ(s.p99_ms, 5000);
    EXPECT_EQ(s.avg_ms, 59);  // (99 * 10 + 5000) / 100 = 59.9
}

TEST(Summarize, P99UsesFloorIndex) {
    // 250 outcomes 1..250ms: index floor(250 * 0.99) = 247 -> 248ms
    std::vector<Outcome> window;
    for (int i = 250; i >= 1; --i) window.push_back(ok(i));

    auto s = ResultReporter::summarize(window, seconds(1));
    EXPECT_EQ(s.p99_ms, 248);
    EXPECT_EQ(window.front().elapsed, milliseconds(1));  // sorted in place
}

TEST(Summarize, EmptyWindow) {
    std::vector<Outcome> window;
    auto s = ResultReporter::summarize(window, seconds(10));
    EXPECT_EQ(s.requests, 0u);
    EXPECT_DOUBLE_EQ(s.throughput, 0.0);
    EXPECT_TRUE(s.error_counts.empty());
}

TEST(Summarize, GroupsErrorsByMessage) {
    std::vector<Outcome> window{
        failed(5, "unexpected status code: 500"),
        ok(5),
        failed(5, "no download urls found"),
        failed(5, "unexpected status code: 500"),
        failed(5, "unexpected status code: 500"),
    };
    auto s = ResultReporter::summarize(window, seconds(10));
    EXPECT_EQ(s.errors, 4u);
    ASSERT_EQ(s.error_counts.size(), 2u);
    EXPECT_EQ(s.error_counts[0], std::make_pair(std::string("no download urls found"), 1));
    EXPECT_EQ(s.error_counts[1], std::make_pair(std::string("unexpected status code: 500"), 3));
}

// ── format ────────────────────────────────────────────────────────────────────

TEST(Format, SummaryAndErrorLines) {
    IntervalSummary s;
    s.requests = 25;
    s.throughput = 2.5;
    s.avg_ms = 120;
    s.p99_ms = 900;
    s.errors = 4;
    s.error_counts = {{"download returned empty body", 1}, {"unexpected status code: 502", 3}};

    auto lines = ResultReporter::format("download", s);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "download: 2.5 req/s, avg 120ms, p99 900ms, 4 errors");
    EXPECT_EQ(lines[1], "download: download returned empty body");
    EXPECT_EQ(lines[2], "download: unexpected status code: 502 (3 times)");
}

TEST(Format, EmptyWindowOnlyThroughput) {
    IntervalSummary s;
    auto lines = ResultReporter::format("ui", s);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "ui: 0.0 req/s");
}

// ── reporter thread ───────────────────────────────────────────────────────────

TEST(ResultReporter, DropsOutcomesAfterShutdown) {
    ShutdownSignal shutdown;
    ResultReporter reporter("search", milliseconds(20), shutdown);
    reporter.start();

    EXPECT_TRUE(reporter.submit(ok(1)));
    EXPECT_TRUE(reporter.submit(failed(1, "boom")));
    std::this_thread::sleep_for(milliseconds(60));

    shutdown.trigger();
    reporter.join();

    EXPECT_FALSE(reporter.submit(ok(1)));
    EXPECT_EQ(reporter.accepted(), 2);
}

TEST(ResultReporter, RejectsNonPositiveInterval) {
    ShutdownSignal shutdown;
    EXPECT_THROW(ResultReporter("ui", milliseconds(0), shutdown), std::invalid_argument);
}
