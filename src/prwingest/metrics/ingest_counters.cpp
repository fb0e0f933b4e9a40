#include "prwingest/metrics/ingest_counters.h"
#include <chrono>

namespace prwingest {
namespace metrics {

IngestCounters::IngestCounters(const RollingBucketConfig& config, RollingBucket::ClockFn clock)
    : latency_(kLatencyMetric, config, clock)
    , batch_size_(kBatchSizeMetric, config, clock) {}

void IngestCounters::RecordError() {
    total_errors_.fetch_add(1, std::memory_order_relaxed);
}

void IngestCounters::RecordNaN() {
    total_nans_.fetch_add(1, std::memory_order_relaxed);
}

void IngestCounters::RecordBadDatapoints(uint64_t count) {
    total_bad_datapoints_.fetch_add(count, std::memory_order_relaxed);
}

void IngestCounters::RecordLatency(uint64_t duration_ns) {
    latency_.Add(static_cast<double>(duration_ns));
}

void IngestCounters::RecordBatchSize(size_t datapoints) {
    batch_size_.Add(static_cast<double>(datapoints));
}

IngestCountersSnapshot IngestCounters::GetSnapshot() const {
    IngestCountersSnapshot snapshot;
    snapshot.total_errors = total_errors();
    snapshot.total_nans = total_nans();
    snapshot.total_bad_datapoints = total_bad_datapoints();
    snapshot.latency = latency_.GetSnapshot();
    snapshot.batch_size = batch_size_.GetSnapshot();
    return snapshot;
}

std::vector<core::Datapoint> IngestCounters::Datapoints() const {
    auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return Datapoints(static_cast<core::TimestampNs>(now));
}

std::vector<core::Datapoint> IngestCounters::Datapoints(core::TimestampNs now_ns) const {
    auto dps = latency_.Datapoints(now_ns);
    auto drain = batch_size_.Datapoints(now_ns);
    dps.insert(dps.end(), drain.begin(), drain.end());

    auto cumulative = [&](const char* name, uint64_t value) {
        dps.emplace_back(name, core::LabelMap{}, core::Value::Integer(static_cast<int64_t>(value)),
                         core::MetricKind::COUNTER, now_ns);
    };
    cumulative(kErrorsMetric, total_errors());
    cumulative(kNaNsMetric, total_nans());
    cumulative(kBadDatapointsMetric, total_bad_datapoints());
    return dps;
}

} // namespace metrics
} // namespace prwingest
