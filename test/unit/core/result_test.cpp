#include <gtest/gtest.h>
#include "prwingest/core/result.h"
#include <stdexcept>

namespace prwingest {
namespace core {
namespace {

TEST(ResultVoidTest, Success) {
    Result<void> result;
    EXPECT_TRUE(result.ok());
    EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultVoidTest, Error) {
    auto result = Result<void>::error("POST failed", Error::Code::SINK_FORWARD);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error(), "POST failed");
    EXPECT_EQ(result.code(), Error::Code::SINK_FORWARD);

    Result<void> copy = result;
    EXPECT_FALSE(copy.ok());
    EXPECT_EQ(copy.error(), "POST failed");
    EXPECT_EQ(copy.code(), Error::Code::SINK_FORWARD);
}

TEST(ResultVoidTest, CodeDefaultsToUnknown) {
    EXPECT_EQ(Result<void>().code(), Error::Code::UNKNOWN);
    EXPECT_EQ(Result<void>::error("plain").code(), Error::Code::UNKNOWN);

    auto cancelled = Result<void>::error("deadline exceeded", Error::Code::CANCELLED);
    EXPECT_EQ(cancelled.code(), Error::Code::CANCELLED);
}

} // namespace
} // namespace core
} // namespace prwingest
