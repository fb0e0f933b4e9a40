#include <gtest/gtest.h>
#include "prwingest/metrics/ingest_counters.h"
#include <set>
#include <thread>

using namespace prwingest;
using namespace prwingest::metrics;

TEST(IngestCountersTest, StartAtZero) {
    IngestCounters counters;
    EXPECT_EQ(counters.total_errors(), 0u);
    EXPECT_EQ(counters.total_nans(), 0u);
    EXPECT_EQ(counters.total_bad_datapoints(), 0u);
}

TEST(IngestCountersTest, Record) {
    IngestCounters counters;
    counters.RecordError();
    counters.RecordNaN();
    counters.RecordNaN();
    counters.RecordBadDatapoints(3);
    counters.RecordBadDatapoints(0);
    counters.RecordLatency(1500);
    counters.RecordBatchSize(42);

    auto snapshot = counters.GetSnapshot();
    EXPECT_EQ(snapshot.total_errors, 1u);
    EXPECT_EQ(snapshot.total_nans, 2u);
    EXPECT_EQ(snapshot.total_bad_datapoints, 3u);
    EXPECT_EQ(snapshot.latency.count, 1u);
    EXPECT_DOUBLE_EQ(snapshot.latency.sum, 1500.0);
    EXPECT_EQ(snapshot.batch_size.count, 1u);
    EXPECT_DOUBLE_EQ(snapshot.batch_size.sum, 42.0);
}

TEST(IngestCountersTest, IndependentInstances) {
    IngestCounters a;
    IngestCounters b;
    a.RecordError();
    EXPECT_EQ(a.total_errors(), 1u);
    EXPECT_EQ(b.total_errors(), 0u);
}

TEST(IngestCountersTest, DatapointNames) {
    IngestCounters counters;
    counters.RecordLatency(1000);
    counters.RecordBatchSize(10);
    counters.RecordError();

    auto dps = counters.Datapoints(123);
    std::set<std::string> names;
    for (const auto& dp : dps) {
        names.insert(dp.metric());
        EXPECT_EQ(dp.timestamp_ns(), 123);
    }

    EXPECT_EQ(names.count("prometheus.request_time.ns.count"), 1u);
    EXPECT_EQ(names.count("prometheus.request_time.ns.p99"), 1u);
    EXPECT_EQ(names.count("prometheus.drain_size.sum"), 1u);
    EXPECT_EQ(names.count("prometheus.drain_size.max"), 1u);
    EXPECT_EQ(names.count("prometheus.invalid_requests"), 1u);
    EXPECT_EQ(names.count("prometheus.total_NAN_samples"), 1u);
    EXPECT_EQ(names.count("prometheus.total_bad_datapoints"), 1u);

    const auto& errors = dps[dps.size() - 3];
    EXPECT_EQ(errors.metric(), IngestCounters::kErrorsMetric);
    EXPECT_EQ(errors.value(), core::Value::Integer(1));
    EXPECT_EQ(errors.kind(), core::MetricKind::COUNTER);
}

TEST(IngestCountersTest, FreshCountersReportCumulativeOnly) {
    IngestCounters counters;
    auto dps = counters.Datapoints(1);
    // count/sum/sumsquare for both distributions plus three counters
    EXPECT_EQ(dps.size(), 9u);
}

TEST(IngestCountersTest, ConcurrentUpdates) {
    IngestCounters counters;
    const int kThreads = 8;
    const int kPerThread = 10000;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; t++) {
        threads.emplace_back([&counters]() {
            for (int i = 0; i < kPerThread; i++) {
                counters.RecordError();
                counters.RecordNaN();
                counters.RecordBadDatapoints(2);
                if (i % 100 == 0) {
                    counters.RecordLatency(static_cast<uint64_t>(i));
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const uint64_t total = static_cast<uint64_t>(kThreads) * kPerThread;
    EXPECT_EQ(counters.total_errors(), total);
    EXPECT_EQ(counters.total_nans(), total);
    EXPECT_EQ(counters.total_bad_datapoints(), total * 2);
    EXPECT_EQ(counters.GetSnapshot().latency.count, total / 100);
}
