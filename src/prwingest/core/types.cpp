#include "prwingest/core/types.h"
#include "prwingest/core/error.h"
#include <sstream>

namespace prwingest {
namespace core {

const char* to_string(MetricKind kind) {
    switch (kind) {
        case MetricKind::COUNTER: return "counter";
        case MetricKind::GAUGE: return "gauge";
    }
    return "gauge";
}

Value Value::Integer(int64_t value) {
    return Value(std::variant<int64_t, double>(std::in_place_index<0>, value));
}

Value Value::Float(double value) {
    return Value(std::variant<int64_t, double>(std::in_place_index<1>, value));
}

int64_t Value::as_integer() const {
    if (!is_integer()) {
        throw InvalidArgumentError("Value holds a floating point number");
    }
    return std::get<int64_t>(value_);
}

double Value::as_double() const {
    if (is_integer()) {
        return static_cast<double>(std::get<int64_t>(value_));
    }
    return std::get<double>(value_);
}

std::string Value::to_string() const {
    std::ostringstream oss;
    if (is_integer()) {
        oss << std::get<int64_t>(value_);
    } else {
        oss << std::get<double>(value_);
    }
    return oss.str();
}

Datapoint::Datapoint(std::string metric,
                     std::shared_ptr<const LabelMap> dimensions,
                     Value value,
                     MetricKind kind,
                     TimestampNs timestamp_ns)
    : metric_(std::move(metric))
    , dimensions_(dimensions ? std::move(dimensions) : std::make_shared<const LabelMap>())
    , value_(value)
    , kind_(kind)
    , timestamp_ns_(timestamp_ns) {
    if (metric_.empty()) {
        throw InvalidArgumentError("Datapoint metric name cannot be empty");
    }
}

Datapoint::Datapoint(std::string metric,
                     LabelMap dimensions,
                     Value value,
                     MetricKind kind,
                     TimestampNs timestamp_ns)
    : Datapoint(std::move(metric),
                std::make_shared<const LabelMap>(std::move(dimensions)),
                value, kind, timestamp_ns) {}

bool Datapoint::operator==(const Datapoint& other) const {
    return metric_ == other.metric_ &&
           *dimensions_ == *other.dimensions_ &&
           value_ == other.value_ &&
           kind_ == other.kind_ &&
           timestamp_ns_ == other.timestamp_ns_;
}

std::string Datapoint::to_string() const {
    std::ostringstream oss;
    oss << metric_ << "{";
    bool first = true;
    for (const auto& [name, value] : *dimensions_) {
        if (!first) {
            oss << ", ";
        }
        oss << name << "=\"" << value << "\"";
        first = false;
    }
    oss << "} " << value_.to_string() << " " << core::to_string(kind_) << " @" << timestamp_ns_;
    return oss.str();
}

} // namespace core
} // namespace prwingest
