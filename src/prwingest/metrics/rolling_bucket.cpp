#include "prwingest/metrics/rolling_bucket.h"
#include "prwingest/core/error.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace prwingest {
namespace metrics {

namespace {

std::string QuantileSuffix(double q) {
    std::ostringstream oss;
    oss << ".p" << q * 100.0;
    return oss.str();
}

double NearestRank(const std::vector<double>& sorted, double q) {
    auto rank = static_cast<size_t>(std::ceil(q * static_cast<double>(sorted.size())));
    if (rank == 0) {
        rank = 1;
    }
    return sorted[std::min(rank, sorted.size()) - 1];
}

} // namespace

RollingBucket::RollingBucket(std::string metric_name, RollingBucketConfig config, ClockFn clock)
    : metric_name_(std::move(metric_name))
    , config_(std::move(config))
    , clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })) {
    if (config_.bucket_width.count() <= 0) {
        throw core::InvalidArgumentError("Rolling bucket width must be positive");
    }
    for (double q : config_.quantiles) {
        if (!(q > 0.0 && q <= 1.0)) {
            throw core::InvalidArgumentError("Quantiles must be in (0, 1]");
        }
    }
    window_start_ = clock_();
}

void RollingBucket::RollLocked(Clock::time_point now) const {
    auto elapsed = now - window_start_;
    if (elapsed < config_.bucket_width) {
        return;
    }
    auto windows = elapsed / config_.bucket_width;
    if (windows == 1) {
        previous_window_ = std::move(current_window_);
    } else {
        // Idle for more than a full window: the last completed one was empty
        previous_window_.clear();
    }
    current_window_.clear();
    window_start_ += windows * config_.bucket_width;
}

void RollingBucket::Add(double value) {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    RollLocked(now);
    count_++;
    sum_ += value;
    sum_of_squares_ += value * value;
    current_window_.push_back(value);
}

RollingBucketSnapshot RollingBucket::GetSnapshot() const {
    auto now = clock_();
    std::vector<double> window;
    RollingBucketSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        RollLocked(now);
        snapshot.count = count_;
        snapshot.sum = sum_;
        snapshot.sum_of_squares = sum_of_squares_;
        window = previous_window_.empty() ? current_window_ : previous_window_;
    }

    if (window.empty()) {
        return snapshot;
    }
    std::sort(window.begin(), window.end());
    snapshot.window_count = window.size();
    snapshot.min = window.front();
    snapshot.max = window.back();
    for (double q : config_.quantiles) {
        snapshot.quantiles.emplace_back(q, NearestRank(window, q));
    }
    return snapshot;
}

std::vector<core::Datapoint> RollingBucket::Datapoints(core::TimestampNs now_ns) const {
    auto snapshot = GetSnapshot();
    std::vector<core::Datapoint> dps;
    dps.reserve(5 + snapshot.quantiles.size());

    dps.emplace_back(metric_name_ + ".count", core::LabelMap{},
                     core::Value::Integer(static_cast<int64_t>(snapshot.count)),
                     core::MetricKind::COUNTER, now_ns);
    dps.emplace_back(metric_name_ + ".sum", core::LabelMap{},
                     core::Value::Float(snapshot.sum), core::MetricKind::COUNTER, now_ns);
    dps.emplace_back(metric_name_ + ".sumsquare", core::LabelMap{},
                     core::Value::Float(snapshot.sum_of_squares), core::MetricKind::COUNTER, now_ns);

    if (snapshot.window_count > 0) {
        dps.emplace_back(metric_name_ + ".min", core::LabelMap{},
                         core::Value::Float(*snapshot.min), core::MetricKind::GAUGE, now_ns);
        dps.emplace_back(metric_name_ + ".max", core::LabelMap{},
                         core::Value::Float(*snapshot.max), core::MetricKind::GAUGE, now_ns);
        for (const auto& [q, value] : snapshot.quantiles) {
            dps.emplace_back(metric_name_ + QuantileSuffix(q), core::LabelMap{},
                             core::Value::Float(value), core::MetricKind::GAUGE, now_ns);
        }
    }
    return dps;
}

} // namespace metrics
} // namespace prwingest
