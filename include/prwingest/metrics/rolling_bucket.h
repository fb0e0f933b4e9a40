#pragma once

#include "prwingest/core/types.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace prwingest {
namespace metrics {

struct RollingBucketConfig {
    std::chrono::milliseconds bucket_width{10000};  // Window length for min/max/quantiles
    std::vector<double> quantiles{0.5, 0.9, 0.99};  // Reported as p50, p90, p99
};

struct RollingBucketSnapshot {
    // Cumulative since construction
    uint64_t count = 0;
    double sum = 0.0;
    double sum_of_squares = 0.0;

    // Most recent window with observations
    uint64_t window_count = 0;
    std::optional<double> min;
    std::optional<double> max;
    std::vector<std::pair<double, double>> quantiles;  // (q, value)
};

/**
 * @brief Lock-protected rolling distribution
 *
 * Keeps cumulative count/sum/sum-of-squares for the process lifetime and
 * min/max/quantiles over fixed-width windows. Reports the last completed
 * window, or the open window when no completed one has observations.
 */
class RollingBucket {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    explicit RollingBucket(std::string metric_name,
                           RollingBucketConfig config = RollingBucketConfig{},
                           ClockFn clock = nullptr);

    RollingBucket(const RollingBucket&) = delete;
    RollingBucket& operator=(const RollingBucket&) = delete;

    void Add(double value);

    RollingBucketSnapshot GetSnapshot() const;

    /**
     * @brief Distribution as named datapoints
     *
     * `<name>.count`, `<name>.sum`, `<name>.sumsquare` are counters;
     * `<name>.min`, `<name>.max` and `<name>.p<q>` are gauges, emitted only
     * when a window has observations.
     */
    std::vector<core::Datapoint> Datapoints(core::TimestampNs now_ns) const;

    const std::string& metric_name() const { return metric_name_; }

private:
    void RollLocked(Clock::time_point now) const;

    std::string metric_name_;
    RollingBucketConfig config_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    uint64_t count_ = 0;
    double sum_ = 0.0;
    double sum_of_squares_ = 0.0;
    mutable std::vector<double> current_window_;
    mutable std::vector<double> previous_window_;
    mutable Clock::time_point window_start_;
};

} // namespace metrics
} // namespace prwingest
