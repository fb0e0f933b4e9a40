#include <gtest/gtest.h>
#include "prwingest/core/types.h"
#include "prwingest/core/error.h"
#include <limits>

namespace prwingest {
namespace core {
namespace {

TEST(ValueTest, Integer) {
    auto v = Value::Integer(42);
    EXPECT_TRUE(v.is_integer());
    EXPECT_EQ(v.as_integer(), 42);
    EXPECT_DOUBLE_EQ(v.as_double(), 42.0);
    EXPECT_EQ(v.to_string(), "42");
}

TEST(ValueTest, Float) {
    auto v = Value::Float(0.75);
    EXPECT_FALSE(v.is_integer());
    EXPECT_DOUBLE_EQ(v.as_double(), 0.75);
    EXPECT_THROW(v.as_integer(), InvalidArgumentError);
}

TEST(ValueTest, IntegerAndFloatAreDistinct) {
    EXPECT_NE(Value::Integer(1), Value::Float(1.0));
    EXPECT_EQ(Value::Integer(1), Value::Integer(1));
    EXPECT_EQ(Value::Float(2.5), Value::Float(2.5));
}

TEST(ValueTest, Infinity) {
    auto v = Value::Float(std::numeric_limits<double>::infinity());
    EXPECT_FALSE(v.is_integer());
    EXPECT_EQ(v.as_double(), std::numeric_limits<double>::infinity());
}

TEST(MetricKindTest, ToString) {
    EXPECT_STREQ(to_string(MetricKind::COUNTER), "counter");
    EXPECT_STREQ(to_string(MetricKind::GAUGE), "gauge");
}

class DatapointTest : public ::testing::Test {
protected:
    void SetUp() override {
        dims_ = {{"host", "server1"}, {"job", "node"}};
    }

    LabelMap dims_;
};

TEST_F(DatapointTest, Construction) {
    Datapoint dp("http_requests_total", dims_, Value::Integer(7), MetricKind::COUNTER, 1000000);

    EXPECT_EQ(dp.metric(), "http_requests_total");
    EXPECT_EQ(dp.dimensions().size(), 2u);
    EXPECT_EQ(dp.dimensions().at("host"), "server1");
    EXPECT_EQ(dp.value(), Value::Integer(7));
    EXPECT_EQ(dp.kind(), MetricKind::COUNTER);
    EXPECT_EQ(dp.timestamp_ns(), 1000000);
}

TEST_F(DatapointTest, EmptyMetricNameRejected) {
    EXPECT_THROW(Datapoint("", dims_, Value::Integer(1), MetricKind::GAUGE, 0),
                 InvalidArgumentError);
}

TEST_F(DatapointTest, SharedDimensions) {
    auto shared = std::make_shared<const LabelMap>(dims_);
    Datapoint a("temp", shared, Value::Float(1.5), MetricKind::GAUGE, 1);
    Datapoint b("temp", shared, Value::Float(2.5), MetricKind::GAUGE, 2);

    EXPECT_EQ(&a.dimensions(), &b.dimensions());
    EXPECT_NE(a, b);
}

TEST_F(DatapointTest, NullDimensionsAreEmpty) {
    Datapoint dp("temp", std::shared_ptr<const LabelMap>(), Value::Float(1.5), MetricKind::GAUGE, 1);
    EXPECT_TRUE(dp.dimensions().empty());
}

TEST_F(DatapointTest, Equality) {
    Datapoint a("temp", dims_, Value::Float(1.5), MetricKind::GAUGE, 1);
    Datapoint b("temp", dims_, Value::Float(1.5), MetricKind::GAUGE, 1);
    Datapoint c("temp", LabelMap{}, Value::Float(1.5), MetricKind::GAUGE, 1);

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST_F(DatapointTest, ToString) {
    Datapoint dp("up", LabelMap{{"job", "node"}}, Value::Integer(1), MetricKind::GAUGE, 5);
    EXPECT_EQ(dp.to_string(), "up{job=\"node\"} 1 gauge @5");
}

} // namespace
} // namespace core
} // namespace prwingest
