#ifndef PRWINGEST_CORE_TYPES_H_
#define PRWINGEST_CORE_TYPES_H_

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>

namespace prwingest {
namespace core {

/**
 * @brief Label name to label value, one entry per distinct name
 */
using LabelMap = std::map<std::string, std::string>;

/**
 * @brief Absolute timestamp in nanoseconds since Unix epoch
 */
using TimestampNs = int64_t;

/**
 * @brief Semantic category used downstream to pick an aggregation
 */
enum class MetricKind {
    COUNTER,  // Monotonic accumulation
    GAUGE     // Arbitrary fluctuation
};

const char* to_string(MetricKind kind);

/**
 * @brief Numeric datapoint value, either integer or floating point
 */
class Value {
public:
    static Value Integer(int64_t value);
    static Value Float(double value);

    bool is_integer() const { return std::holds_alternative<int64_t>(value_); }

    /**
     * @throws InvalidArgumentError if the value is floating point
     */
    int64_t as_integer() const;

    /**
     * @brief Value as a double, widening integers
     */
    double as_double() const;

    bool operator==(const Value& other) const { return value_ == other.value_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

    std::string to_string() const;

private:
    explicit Value(std::variant<int64_t, double> value) : value_(value) {}

    std::variant<int64_t, double> value_;
};

/**
 * @brief Converted output unit forwarded to a sink
 *
 * Immutable once constructed. Datapoints produced from one series share
 * the same dimension map.
 */
class Datapoint {
public:
    /**
     * @throws InvalidArgumentError if metric is empty
     */
    Datapoint(std::string metric,
              std::shared_ptr<const LabelMap> dimensions,
              Value value,
              MetricKind kind,
              TimestampNs timestamp_ns);

    Datapoint(std::string metric,
              LabelMap dimensions,
              Value value,
              MetricKind kind,
              TimestampNs timestamp_ns);

    const std::string& metric() const { return metric_; }
    const LabelMap& dimensions() const { return *dimensions_; }
    const Value& value() const { return value_; }
    MetricKind kind() const { return kind_; }
    TimestampNs timestamp_ns() const { return timestamp_ns_; }

    bool operator==(const Datapoint& other) const;
    bool operator!=(const Datapoint& other) const { return !(*this == other); }

    std::string to_string() const;

private:
    std::string metric_;
    std::shared_ptr<const LabelMap> dimensions_;
    Value value_;
    MetricKind kind_;
    TimestampNs timestamp_ns_;
};

} // namespace core
} // namespace prwingest

#endif // PRWINGEST_CORE_TYPES_H_
