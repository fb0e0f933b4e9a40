#pragma once

#include "prwingest/core/context.h"
#include "prwingest/core/types.h"
#include "prwingest/metrics/ingest_counters.h"
#include "prwingest/remote/sample_converter.h"
#include "prwingest/server/request.h"
#include "prwingest/sink/sink.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Forward declarations for protobuf types
namespace prometheus {
class WriteRequest;
class TimeSeries;
}

namespace prwingest {
namespace remote {

/**
 * @brief Handler for the Prometheus remote-write endpoint
 *
 * Reads, decodes and converts one request into a single batch and forwards
 * it to the sink. Requests are independent; the only shared state is the
 * injected counters, so one handler serves any number of concurrent requests.
 */
class WriteHandler {
public:
    /**
     * @brief Construct a new Write Handler
     * @param sink Downstream consumer of converted batches
     * @param counters Self-observability counters (a fresh set when null)
     */
    explicit WriteHandler(std::shared_ptr<sink::DatapointSink> sink,
                          std::shared_ptr<metrics::IngestCounters> counters = nullptr);

    /**
     * @brief Handle a remote write request
     * @param ctx Request context, bounds the sink call
     * @param req HTTP request with a body reader
     * @return 200 on success, 400 for malformed payloads, 500 otherwise
     */
    server::Response Handle(const core::Context& ctx, const server::Request& req);

    /**
     * @brief Convert every series of a decoded request into one batch
     *
     * Unnamed series and NaN samples are counted and left out.
     */
    std::vector<core::Datapoint> ConvertWriteRequest(const ::prometheus::WriteRequest& request) const;

    /**
     * @brief Current self-observability datapoints
     */
    std::vector<core::Datapoint> Datapoints() const;

    const std::shared_ptr<metrics::IngestCounters>& counters() const { return counters_; }

private:
    void ConvertSeries(const ::prometheus::TimeSeries& series,
                       std::vector<core::Datapoint>& batch) const;

    std::string ReadBody(const server::Request& req) const;

    void Forward(const core::Context& ctx, std::vector<core::Datapoint> batch);

    std::shared_ptr<sink::DatapointSink> sink_;
    std::shared_ptr<metrics::IngestCounters> counters_;
    SampleConverter converter_;
    std::atomic<uint64_t> request_counter_{0};
};

} // namespace remote
} // namespace prwingest
