#include "prwingest/remote/sample_converter.h"
#include "prwingest/core/error.h"
#include "remote.pb.h"
#include <cmath>

namespace prwingest {
namespace remote {

namespace {

// 2^63, the first double past the int64 range.
constexpr double kInt64Bound = 9223372036854775808.0;

} // namespace

SampleConverter::SampleConverter(std::shared_ptr<metrics::IngestCounters> counters)
    : counters_(std::move(counters)) {
    if (!counters_) {
        throw core::InvalidArgumentError("SampleConverter requires counters");
    }
}

std::optional<core::Datapoint> SampleConverter::Convert(const ::prometheus::Sample& sample,
                                                        const SeriesIdentity& series) const {
    if (std::isnan(sample.value())) {
        counters_->RecordNaN();
        return std::nullopt;
    }
    return core::Datapoint(series.metric_name, series.dimensions, ToValue(sample.value()),
                           series.kind, ToTimestampNs(sample.timestamp()));
}

core::Value SampleConverter::ToValue(double value) {
    if (value >= -kInt64Bound && value < kInt64Bound && std::trunc(value) == value) {
        return core::Value::Integer(static_cast<int64_t>(value));
    }
    return core::Value::Float(value);
}

core::TimestampNs SampleConverter::ToTimestampNs(int64_t timestamp_ms) {
    return static_cast<core::TimestampNs>(
        static_cast<uint64_t>(timestamp_ms) * static_cast<uint64_t>(kNanosPerMilli));
}

} // namespace remote
} // namespace prwingest
