#include "load_test.hpp"
#include "workloads/ui_workload.hpp"

#include "stub_server.hpp"

#include <atomic>
#include <set>
#include <thread>

#include <gtest/gtest.h>

using std::chrono::milliseconds;

namespace {

LoadTestConfig short_run(const std::string& host) {
    LoadTestConfig config;
    config.client.host = host;
    config.client.connect_timeout = milliseconds(1000);
    config.client.read_timeout = milliseconds(1000);
    config.workers = 2;
    config.rampup = milliseconds(0);
    config.duration = milliseconds(400);
    config.report_interval = milliseconds(100);
    config.seed = 1u;
    return config;
}

} // namespace

TEST(LoadTest, RunsEnabledWorkloadsUntilDurationElapses) {
    std::atomic<int> hits{0};
    StubServer stub([&](httplib::Server& svr) {
        svr.Get("/", [&](const httplib::Request&, httplib::Response& res) {
            hits++;
            res.set_content("UiFrontend", "text/html");
        });
    });

    LoadTest test(short_run(stub.host()));
    EXPECT_TRUE(test.add_workload(std::make_unique<UiWorkload>(), 50));
    EXPECT_FALSE(test.add_workload(std::make_unique<UiWorkload>(), 0));
    EXPECT_EQ(test.workload_count(), 1u);

    testing::internal::CaptureStdout();
    auto before = std::chrono::steady_clock::now();
    test.run();
    auto took = std::chrono::steady_clock::now() - before;
    const std::string out = testing::internal::GetCapturedStdout();
    EXPECT_GE(took, milliseconds(400));

    auto stats = test.dispatcher_stats();
    ASSERT_EQ(stats.size(), 1u);

    // End-of-run summary names ticks, dispatched, dropped and skipped counts.
    const std::string summary = "ui: " + std::to_string(stats[0].second.ticks) + " ticks, "
        + std::to_string(stats[0].second.admitted) + " requests dispatched, "
        + std::to_string(stats[0].second.dropped) + " ticks dropped with all workers busy, "
        + std::to_string(stats[0].second.skipped) + " skipped during rampup";
    EXPECT_NE(out.find(summary), std::string::npos) << out;
    EXPECT_EQ(stats[0].first, "ui");
    EXPECT_GT(stats[0].second.admitted, 0);
    EXPECT_LE(stats[0].second.admitted, stats[0].second.ticks);

    auto accepted = test.accepted_outcomes();
    ASSERT_EQ(accepted.size(), 1u);
    EXPECT_LE(accepted[0].second, stats[0].second.admitted);
    EXPECT_GE(hits.load(), accepted[0].second);
}

TEST(LoadTest, StopEndsRunEarly) {
    StubServer stub([](httplib::Server& svr) {
        svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("UiFrontend", "text/html");
        });
    });

    LoadTestConfig config = short_run(stub.host());
    config.duration = std::chrono::hours(1);
    LoadTest test(config);
    test.add_workload(std::make_unique<UiWorkload>(), 10);

    std::thread stopper([&test]() {
        std::this_thread::sleep_for(milliseconds(100));
        test.stop();
    });

    auto before = std::chrono::steady_clock::now();
    test.run();
    stopper.join();
    EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::seconds(5));
}

TEST(LoadTest, SeedZeroIsDeterministic) {
    LoadTestConfig config = short_run("127.0.0.1:1");
    config.seed = 0u;
    config.workers = 4;

    for (size_t index = 0; index < 4; ++index) {
        auto dispatcher_seed = LoadTest::dispatcher_seed(config, index);
        ASSERT_TRUE(dispatcher_seed.has_value());

        AdmissionQueue admission;
        ShutdownSignal shutdown;
        RateDispatcher a("ui", 10, std::chrono::seconds(100), admission, shutdown, dispatcher_seed);
        RateDispatcher b("ui", 10, std::chrono::seconds(100), admission, shutdown, dispatcher_seed);
        for (int i = 0; i < 200; ++i) {
            ASSERT_EQ(a.ramp_admit(std::chrono::seconds(50)), b.ramp_admit(std::chrono::seconds(50)));
        }
    }
}

TEST(LoadTest, DerivedSeedsNeverCollide) {
    LoadTestConfig config = short_run("127.0.0.1:1");
    config.seed = 0u;
    config.workers = 3;

    std::set<uint32_t> seen;
    for (size_t index = 0; index < 4; ++index) {
        uint32_t pool = *LoadTest::pool_seed(config, index);
        for (uint32_t i = 0; i < 3; ++i) {
            EXPECT_TRUE(seen.insert(pool + i).second);
        }
        EXPECT_TRUE(seen.insert(*LoadTest::dispatcher_seed(config, index)).second);
    }
}

TEST(LoadTest, UnsetSeedStaysUnset) {
    LoadTestConfig config = short_run("127.0.0.1:1");
    config.seed.reset();
    EXPECT_FALSE(LoadTest::pool_seed(config, 0).has_value());
    EXPECT_FALSE(LoadTest::dispatcher_seed(config, 2).has_value());
}

TEST(LoadTest, RejectsNegativeRate) {
    LoadTest test(short_run("127.0.0.1:1"));
    EXPECT_THROW(test.add_workload(std::make_unique<UiWorkload>(), -1), std::invalid_argument);
}

TEST(LoadTest, RejectsNoWorkers) {
    LoadTestConfig config = short_run("127.0.0.1:1");
    config.workers = 0;
    EXPECT_THROW(LoadTest{config}, std::invalid_argument);
}
