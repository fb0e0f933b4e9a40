#include <gtest/gtest.h>
#include "prwingest/sink/log_sink.h"

using namespace prwingest;
using namespace prwingest::sink;

TEST(LogSinkTest, CountsBatches) {
    LogSink sink;
    core::Context ctx;

    std::vector<core::Datapoint> batch;
    batch.emplace_back("up", core::LabelMap{{"job", "node"}}, core::Value::Integer(1),
                       core::MetricKind::GAUGE, 1000);
    batch.emplace_back("up", core::LabelMap{{"job", "api"}}, core::Value::Integer(0),
                       core::MetricKind::GAUGE, 1000);

    EXPECT_TRUE(sink.AddDatapoints(ctx, batch).ok());
    EXPECT_TRUE(sink.AddDatapoints(ctx, {}).ok());

    EXPECT_EQ(sink.batches(), 2u);
    EXPECT_EQ(sink.datapoints(), 2u);
}

TEST(LogSinkTest, RejectsCancelledContext) {
    LogSink sink;
    core::Context ctx;
    ctx.Cancel();

    auto result = sink.AddDatapoints(ctx, {});
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::CANCELLED);
    EXPECT_EQ(sink.batches(), 0u);
}
