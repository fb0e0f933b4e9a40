#include <gtest/gtest.h>
#include "prwingest/sink/json_encoder.h"
#include <rapidjson/document.h>
#include <limits>

using namespace prwingest;
using namespace prwingest::sink;

class JsonEncoderTest : public ::testing::Test {
protected:
    rapidjson::Document Parse(const std::string& json) {
        rapidjson::Document doc;
        doc.Parse(json.c_str());
        EXPECT_FALSE(doc.HasParseError()) << json;
        return doc;
    }
};

TEST_F(JsonEncoderTest, EmptyBatch) {
    EXPECT_EQ(JsonEncoder::EncodeDatapoints({}), "{\"datapoints\":[]}");
}

TEST_F(JsonEncoderTest, IntegerDatapoint) {
    std::vector<core::Datapoint> dps;
    dps.emplace_back("http_requests_total", core::LabelMap{{"method", "GET"}},
                     core::Value::Integer(5), core::MetricKind::COUNTER, 1000000000);

    EXPECT_EQ(JsonEncoder::EncodeDatapoints(dps),
              "{\"datapoints\":[{\"metric\":\"http_requests_total\","
              "\"dimensions\":{\"method\":\"GET\"},\"value\":5,"
              "\"kind\":\"counter\",\"timestamp_ns\":1000000000}]}");
}

TEST_F(JsonEncoderTest, FloatDatapoint) {
    std::vector<core::Datapoint> dps;
    dps.emplace_back("cpu_usage", core::LabelMap{}, core::Value::Float(0.75),
                     core::MetricKind::GAUGE, 1);

    auto doc = Parse(JsonEncoder::EncodeDatapoints(dps));
    const auto& dp = doc["datapoints"][0];
    ASSERT_TRUE(dp["value"].IsDouble());
    EXPECT_DOUBLE_EQ(dp["value"].GetDouble(), 0.75);
    EXPECT_STREQ(dp["kind"].GetString(), "gauge");
    EXPECT_TRUE(dp["dimensions"].ObjectEmpty());
}

TEST_F(JsonEncoderTest, LargeIntegerKeepsPrecision) {
    std::vector<core::Datapoint> dps;
    dps.emplace_back("bytes_total", core::LabelMap{},
                     core::Value::Integer(9007199254740993LL), core::MetricKind::COUNTER, 1);

    auto doc = Parse(JsonEncoder::EncodeDatapoints(dps));
    ASSERT_TRUE(doc["datapoints"][0]["value"].IsInt64());
    EXPECT_EQ(doc["datapoints"][0]["value"].GetInt64(), 9007199254740993LL);
}

TEST_F(JsonEncoderTest, InfinityAsString) {
    std::vector<core::Datapoint> dps;
    dps.emplace_back("ratio", core::LabelMap{},
                     core::Value::Float(std::numeric_limits<double>::infinity()),
                     core::MetricKind::GAUGE, 1);
    dps.emplace_back("ratio", core::LabelMap{},
                     core::Value::Float(-std::numeric_limits<double>::infinity()),
                     core::MetricKind::GAUGE, 2);

    auto doc = Parse(JsonEncoder::EncodeDatapoints(dps));
    EXPECT_STREQ(doc["datapoints"][0]["value"].GetString(), "+Inf");
    EXPECT_STREQ(doc["datapoints"][1]["value"].GetString(), "-Inf");
}

TEST_F(JsonEncoderTest, EscapesStrings) {
    std::vector<core::Datapoint> dps;
    dps.emplace_back("up", core::LabelMap{{"path", "/a\"b\\c"}},
                     core::Value::Integer(1), core::MetricKind::GAUGE, 1);

    auto doc = Parse(JsonEncoder::EncodeDatapoints(dps));
    EXPECT_STREQ(doc["datapoints"][0]["dimensions"]["path"].GetString(), "/a\"b\\c");
}

TEST_F(JsonEncoderTest, Error) {
    EXPECT_EQ(JsonEncoder::EncodeError("snappy: corrupt input"),
              "{\"error\":\"snappy: corrupt input\"}");
}
