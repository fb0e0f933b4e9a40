#pragma once

#include "prwingest/sink/sink.h"
#include <atomic>
#include <cstdint>

namespace prwingest {
namespace sink {

/**
 * @brief Sink that writes batches to the log
 *
 * Summaries at info, every datapoint at debug. Used when no downstream
 * URL is configured.
 */
class LogSink : public DatapointSink {
public:
    core::Result<void> AddDatapoints(const core::Context& ctx,
                                     std::vector<core::Datapoint> datapoints) override;

    uint64_t batches() const { return batches_.load(); }
    uint64_t datapoints() const { return datapoints_.load(); }

private:
    std::atomic<uint64_t> batches_{0};
    std::atomic<uint64_t> datapoints_{0};
};

} // namespace sink
} // namespace prwingest
