#pragma once

#include "prwingest/sink/sink.h"
#include <chrono>
#include <string>

namespace prwingest {
namespace sink {

/**
 * @brief Forwards each batch as one JSON POST to a downstream HTTP endpoint
 *
 * Connection, read and write timeouts are the request context's remaining
 * time, or `default_timeout` for contexts without a deadline. There is no
 * retry: a failed POST is reported to the caller.
 */
class HttpJsonSink : public DatapointSink {
public:
    /**
     * @param url Downstream endpoint, e.g. "http://127.0.0.1:8080/ingest"
     * @throws core::InvalidArgumentError if the URL is not plain http
     */
    explicit HttpJsonSink(const std::string& url,
                          std::chrono::milliseconds default_timeout = std::chrono::seconds(30));

    core::Result<void> AddDatapoints(const core::Context& ctx,
                                     std::vector<core::Datapoint> datapoints) override;

    const std::string& host() const { return scheme_host_port_; }
    const std::string& path() const { return path_; }

private:
    std::string scheme_host_port_;
    std::string path_;
    std::chrono::milliseconds default_timeout_;
};

} // namespace sink
} // namespace prwingest
