#include "prwingest/remote/label_mapper.h"
#include "remote.pb.h"

namespace prwingest {
namespace remote {

core::LabelMap LabelMapper::ToLabelMap(const LabelList& labels) {
    core::LabelMap map;
    for (const auto& label : labels) {
        map[label.name()] = label.value();
    }
    return map;
}

std::optional<std::string> LabelMapper::ExtractMetricName(core::LabelMap& labels) {
    auto it = labels.find(kMetricNameLabel);
    if (it == labels.end()) {
        return std::nullopt;
    }
    std::string name = std::move(it->second);
    labels.erase(it);
    return name;
}

MappedLabels LabelMapper::Map(const LabelList& labels) {
    MappedLabels mapped;
    mapped.dimensions = ToLabelMap(labels);
    mapped.metric_name = ExtractMetricName(mapped.dimensions);
    return mapped;
}

} // namespace remote
} // namespace prwingest
