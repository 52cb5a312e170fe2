#include "bounded_channel.hpp"
#include "workloads/download_targets.hpp"

#include <thread>
#include <vector>

#include <gtest/gtest.h>

TEST(BoundedChannel, FifoOrder) {
    BoundedChannel<int> ch(4);
    EXPECT_TRUE(ch.try_send(1));
    EXPECT_TRUE(ch.try_send(2));
    EXPECT_EQ(*ch.try_receive(), 1);
    EXPECT_EQ(*ch.try_receive(), 2);
}

TEST(BoundedChannel, EmptyReceiveReturnsNothing) {
    BoundedChannel<std::string> ch(1);
    EXPECT_FALSE(ch.try_receive().has_value());
}

TEST(BoundedChannel, SendDropsWhenFull) {
    BoundedChannel<int> ch(2);
    EXPECT_TRUE(ch.try_send(1));
    EXPECT_TRUE(ch.try_send(2));
    EXPECT_FALSE(ch.try_send(3));
    EXPECT_EQ(ch.size(), 2u);
    EXPECT_EQ(*ch.try_receive(), 1);
    EXPECT_TRUE(ch.try_send(4));
}

TEST(BoundedChannel, ZeroCapacityRejected) {
    EXPECT_THROW(BoundedChannel<int>(0), std::invalid_argument);
}

TEST(BoundedChannel, DownloadTargetsNeverExceedCapacity) {
    DownloadTargets targets(DOWNLOAD_TARGETS_CAPACITY);

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&targets, t]() {
            for (int i = 0; i < 1000; ++i) {
                targets.try_send("/download/thumbnail_" + std::to_string(t) + "_" + std::to_string(i));
            }
        });
    }
    for (auto& w : writers) w.join();

    EXPECT_EQ(targets.size(), DOWNLOAD_TARGETS_CAPACITY);
    EXPECT_FALSE(targets.try_send("one more"));
    EXPECT_EQ(targets.size(), targets.capacity());
}
