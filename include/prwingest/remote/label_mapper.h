#pragma once

#include "prwingest/core/types.h"
#include <optional>
#include <string>
#include <google/protobuf/repeated_field.h>

namespace prometheus {
class Label;
}

namespace prwingest {
namespace remote {

/**
 * @brief Labels of one series split into metric identity and dimensions
 */
struct MappedLabels {
    std::optional<std::string> metric_name;  // nullopt when __name__ is absent
    core::LabelMap dimensions;               // never contains __name__
};

/**
 * @brief Converts a series' label list into a label map
 *
 * Duplicate names are resolved by position: the last occurrence in the
 * label list wins. The wire format does not forbid duplicates and senders
 * do not agree on an order, so the surviving value is only as stable as
 * the sender's label order.
 */
class LabelMapper {
public:
    static constexpr const char* kMetricNameLabel = "__name__";

    using LabelList = google::protobuf::RepeatedPtrField<::prometheus::Label>;

    static core::LabelMap ToLabelMap(const LabelList& labels);

    /**
     * @brief Remove the __name__ entry and return its value
     *
     * An empty value is returned as an empty string, not as std::nullopt.
     */
    static std::optional<std::string> ExtractMetricName(core::LabelMap& labels);

    static MappedLabels Map(const LabelList& labels);
};

} // namespace remote
} // namespace prwingest
