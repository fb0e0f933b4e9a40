#pragma once

#include "prwingest/core/types.h"
#include "prwingest/metrics/rolling_bucket.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace prwingest {
namespace metrics {

struct IngestCountersSnapshot {
    uint64_t total_errors = 0;
    uint64_t total_nans = 0;
    uint64_t total_bad_datapoints = 0;
    RollingBucketSnapshot latency;
    RollingBucketSnapshot batch_size;
};

/**
 * @brief Self-observability tallies of one ingest coordinator
 *
 * Safe under arbitrary concurrent updates. Never reset.
 */
class IngestCounters {
public:
    static constexpr const char* kLatencyMetric = "prometheus.request_time.ns";
    static constexpr const char* kBatchSizeMetric = "prometheus.drain_size";
    static constexpr const char* kErrorsMetric = "prometheus.invalid_requests";
    static constexpr const char* kNaNsMetric = "prometheus.total_NAN_samples";
    static constexpr const char* kBadDatapointsMetric = "prometheus.total_bad_datapoints";

    explicit IngestCounters(const RollingBucketConfig& config = RollingBucketConfig{},
                            RollingBucket::ClockFn clock = nullptr);

    IngestCounters(const IngestCounters&) = delete;
    IngestCounters& operator=(const IngestCounters&) = delete;

    void RecordError();
    void RecordNaN();
    void RecordBadDatapoints(uint64_t count);
    void RecordLatency(uint64_t duration_ns);
    void RecordBatchSize(size_t datapoints);

    uint64_t total_errors() const { return total_errors_.load(std::memory_order_relaxed); }
    uint64_t total_nans() const { return total_nans_.load(std::memory_order_relaxed); }
    uint64_t total_bad_datapoints() const { return total_bad_datapoints_.load(std::memory_order_relaxed); }

    IngestCountersSnapshot GetSnapshot() const;

    /**
     * @brief Current counters as datapoints stamped with the wall clock
     */
    std::vector<core::Datapoint> Datapoints() const;
    std::vector<core::Datapoint> Datapoints(core::TimestampNs now_ns) const;

private:
    std::atomic<uint64_t> total_errors_{0};
    std::atomic<uint64_t> total_nans_{0};
    std::atomic<uint64_t> total_bad_datapoints_{0};
    RollingBucket latency_;
    RollingBucket batch_size_;
};

} // namespace metrics
} // namespace prwingest
