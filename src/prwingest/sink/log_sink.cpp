#include "prwingest/sink/log_sink.h"
#include "prwingest/common/logger.h"

namespace prwingest {
namespace sink {

core::Result<void> LogSink::AddDatapoints(const core::Context& ctx,
                                          std::vector<core::Datapoint> datapoints) {
    if (ctx.IsDone()) {
        return core::Result<void>::error("context done before logging batch",
                                         core::Error::Code::CANCELLED);
    }
    uint64_t batch = ++batches_;
    datapoints_ += datapoints.size();

    PRWINGEST_INFO("[BATCH:{}] {} datapoints", batch, datapoints.size());
    for (const auto& dp : datapoints) {
        PRWINGEST_DEBUG("[BATCH:{}] {}", batch, dp.to_string());
    }
    return core::Result<void>();
}

} // namespace sink
} // namespace prwingest
