#pragma once

#include "prwingest/core/types.h"
#include "prwingest/metrics/ingest_counters.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace prometheus {
class Sample;
}

namespace prwingest {
namespace remote {

/**
 * @brief Identity shared by every sample of one series
 */
struct SeriesIdentity {
    std::string metric_name;
    std::shared_ptr<const core::LabelMap> dimensions;
    core::MetricKind kind;
};

/**
 * @brief Converts remote-write samples into datapoints
 */
class SampleConverter {
public:
    static constexpr int64_t kNanosPerMilli = 1000000;

    explicit SampleConverter(std::shared_ptr<metrics::IngestCounters> counters);

    /**
     * @brief Convert one sample
     * @return std::nullopt for NaN samples, which are counted, not reported as errors
     *
     * Infinities are converted like any other floating point value.
     */
    std::optional<core::Datapoint> Convert(const ::prometheus::Sample& sample,
                                           const SeriesIdentity& series) const;

    /**
     * @brief Integer when the value has no fractional part and fits in int64
     */
    static core::Value ToValue(double value);

    /**
     * @brief Milliseconds to nanoseconds
     *
     * Values outside +/-9.2e12 ms wrap in two's complement rather than being
     * clamped or replaced by the current time.
     */
    static core::TimestampNs ToTimestampNs(int64_t timestamp_ms);

private:
    std::shared_ptr<metrics::IngestCounters> counters_;
};

} // namespace remote
} // namespace prwingest
