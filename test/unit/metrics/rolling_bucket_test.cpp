#include <gtest/gtest.h>
#include "prwingest/metrics/rolling_bucket.h"
#include "prwingest/core/error.h"
#include <algorithm>
#include <thread>

using namespace prwingest;
using namespace prwingest::metrics;

class RollingBucketTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = RollingBucket::Clock::time_point{} + std::chrono::hours(1);
        clock_ = [this]() { return now_; };
    }

    void Advance(std::chrono::milliseconds d) { now_ += d; }

    static const core::Datapoint* Find(const std::vector<core::Datapoint>& dps, const std::string& name) {
        auto it = std::find_if(dps.begin(), dps.end(),
                               [&name](const core::Datapoint& dp) { return dp.metric() == name; });
        return it == dps.end() ? nullptr : &*it;
    }

    RollingBucket::Clock::time_point now_;
    RollingBucket::ClockFn clock_;
};

TEST_F(RollingBucketTest, EmptySnapshot) {
    RollingBucket bucket("latency", RollingBucketConfig{}, clock_);
    auto snapshot = bucket.GetSnapshot();

    EXPECT_EQ(snapshot.count, 0u);
    EXPECT_DOUBLE_EQ(snapshot.sum, 0.0);
    EXPECT_EQ(snapshot.window_count, 0u);
    EXPECT_FALSE(snapshot.min.has_value());
    EXPECT_FALSE(snapshot.max.has_value());
    EXPECT_TRUE(snapshot.quantiles.empty());
}

TEST_F(RollingBucketTest, CumulativeStatistics) {
    RollingBucket bucket("latency", RollingBucketConfig{}, clock_);
    bucket.Add(1.0);
    bucket.Add(2.0);
    bucket.Add(3.0);

    auto snapshot = bucket.GetSnapshot();
    EXPECT_EQ(snapshot.count, 3u);
    EXPECT_DOUBLE_EQ(snapshot.sum, 6.0);
    EXPECT_DOUBLE_EQ(snapshot.sum_of_squares, 14.0);
    EXPECT_EQ(snapshot.window_count, 3u);
    EXPECT_DOUBLE_EQ(*snapshot.min, 1.0);
    EXPECT_DOUBLE_EQ(*snapshot.max, 3.0);
}

TEST_F(RollingBucketTest, NearestRankQuantiles) {
    RollingBucket bucket("latency", RollingBucketConfig{}, clock_);
    for (int i = 100; i >= 1; i--) {
        bucket.Add(static_cast<double>(i));
    }

    auto snapshot = bucket.GetSnapshot();
    ASSERT_EQ(snapshot.quantiles.size(), 3u);
    EXPECT_DOUBLE_EQ(snapshot.quantiles[0].first, 0.5);
    EXPECT_DOUBLE_EQ(snapshot.quantiles[0].second, 50.0);
    EXPECT_DOUBLE_EQ(snapshot.quantiles[1].second, 90.0);
    EXPECT_DOUBLE_EQ(snapshot.quantiles[2].second, 99.0);
}

TEST_F(RollingBucketTest, ReportsLastCompletedWindow) {
    RollingBucket bucket("latency", RollingBucketConfig{}, clock_);
    bucket.Add(1.0);
    bucket.Add(3.0);

    Advance(std::chrono::seconds(10));
    bucket.Add(50.0);

    auto snapshot = bucket.GetSnapshot();
    EXPECT_EQ(snapshot.count, 3u);
    EXPECT_EQ(snapshot.window_count, 2u);
    EXPECT_DOUBLE_EQ(*snapshot.max, 3.0);

    Advance(std::chrono::seconds(10));
    snapshot = bucket.GetSnapshot();
    EXPECT_EQ(snapshot.window_count, 1u);
    EXPECT_DOUBLE_EQ(*snapshot.min, 50.0);
    EXPECT_DOUBLE_EQ(*snapshot.max, 50.0);
}

TEST_F(RollingBucketTest, IdleWindowsExpire) {
    RollingBucket bucket("latency", RollingBucketConfig{}, clock_);
    bucket.Add(7.0);

    Advance(std::chrono::seconds(25));
    auto snapshot = bucket.GetSnapshot();
    EXPECT_EQ(snapshot.count, 1u);
    EXPECT_EQ(snapshot.window_count, 0u);
    EXPECT_FALSE(snapshot.min.has_value());

    bucket.Add(9.0);
    snapshot = bucket.GetSnapshot();
    EXPECT_EQ(snapshot.window_count, 1u);
    EXPECT_DOUBLE_EQ(*snapshot.min, 9.0);
}

TEST_F(RollingBucketTest, DatapointNames) {
    RollingBucket bucket("prometheus.request_time.ns", RollingBucketConfig{}, clock_);

    auto empty = bucket.Datapoints(42);
    ASSERT_EQ(empty.size(), 3u);
    EXPECT_EQ(empty[0].metric(), "prometheus.request_time.ns.count");
    EXPECT_EQ(empty[1].metric(), "prometheus.request_time.ns.sum");
    EXPECT_EQ(empty[2].metric(), "prometheus.request_time.ns.sumsquare");

    bucket.Add(100.0);
    auto dps = bucket.Datapoints(42);
    ASSERT_EQ(dps.size(), 8u);
    for (const char* suffix : {".min", ".max", ".p50", ".p90", ".p99"}) {
        const auto* dp = Find(dps, std::string("prometheus.request_time.ns") + suffix);
        ASSERT_NE(dp, nullptr) << suffix;
        EXPECT_EQ(dp->kind(), core::MetricKind::GAUGE);
        EXPECT_DOUBLE_EQ(dp->value().as_double(), 100.0);
        EXPECT_EQ(dp->timestamp_ns(), 42);
    }

    const auto* count = Find(dps, "prometheus.request_time.ns.count");
    ASSERT_NE(count, nullptr);
    EXPECT_EQ(count->value(), core::Value::Integer(1));
    EXPECT_EQ(count->kind(), core::MetricKind::COUNTER);
}

TEST_F(RollingBucketTest, InvalidConfig) {
    RollingBucketConfig zero_width;
    zero_width.bucket_width = std::chrono::milliseconds(0);
    EXPECT_THROW(RollingBucket("x", zero_width), core::InvalidArgumentError);

    RollingBucketConfig bad_quantile;
    bad_quantile.quantiles = {0.5, 1.5};
    EXPECT_THROW(RollingBucket("x", bad_quantile), core::InvalidArgumentError);
}

TEST_F(RollingBucketTest, ConcurrentAdds) {
    RollingBucket bucket("drain");
    const int kThreads = 8;
    const int kPerThread = 1000;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; t++) {
        threads.emplace_back([&bucket]() {
            for (int i = 0; i < kPerThread; i++) {
                bucket.Add(1.0);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto snapshot = bucket.GetSnapshot();
    EXPECT_EQ(snapshot.count, static_cast<uint64_t>(kThreads * kPerThread));
    EXPECT_DOUBLE_EQ(snapshot.sum, kThreads * kPerThread * 1.0);
}
