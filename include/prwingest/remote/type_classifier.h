#pragma once

#include "prwingest/core/types.h"
#include <string>
#include <vector>

namespace prwingest {
namespace remote {

struct SuffixRule {
    std::string suffix;
    core::MetricKind kind;
};

/**
 * @brief Infers the metric kind from Prometheus naming conventions
 *
 * Rules are evaluated in order and the first matching suffix wins; names
 * matching no rule are gauges. `_sum` is deliberately absent: histogram and
 * summary sums may decrease when observations are negative.
 *
 * See https://prometheus.io/docs/practices/naming/ and
 * https://prometheus.io/docs/practices/histograms/
 */
class TypeClassifier {
public:
    static core::MetricKind Classify(const std::string& metric_name);

    static const std::vector<SuffixRule>& Rules();
};

} // namespace remote
} // namespace prwingest
