#include "prwingest/remote/type_classifier.h"

namespace prwingest {
namespace remote {

namespace {

bool HasSuffix(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

const std::vector<SuffixRule>& TypeClassifier::Rules() {
    static const std::vector<SuffixRule> rules = {
        {"_total", core::MetricKind::COUNTER},   // counter convention
        {"_bucket", core::MetricKind::COUNTER},  // cumulative histogram buckets, le="<bound>"
        {"_count", core::MetricKind::COUNTER},   // observation count of histograms and summaries
    };
    return rules;
}

core::MetricKind TypeClassifier::Classify(const std::string& metric_name) {
    for (const auto& rule : Rules()) {
        if (HasSuffix(metric_name, rule.suffix)) {
            return rule.kind;
        }
    }
    return core::MetricKind::GAUGE;
}

} // namespace remote
} // namespace prwingest
