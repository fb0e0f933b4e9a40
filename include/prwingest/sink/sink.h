#pragma once

#include "prwingest/core/context.h"
#include "prwingest/core/result.h"
#include "prwingest/core/types.h"
#include <vector>

namespace prwingest {
namespace sink {

/**
 * @brief Downstream consumer of converted datapoints
 *
 * Implementations own delivery and retry. They must bound any blocking
 * work by the context and must be safe to call from concurrent requests.
 */
class DatapointSink {
public:
    virtual ~DatapointSink() = default;

    /**
     * @brief Accept one request's batch as a unit
     * @param ctx Request context; the batch may be abandoned once it is done
     * @param datapoints Batch, ownership passes to the sink
     * @return Error with code CANCELLED when the context ended the forward,
     *         SINK_FORWARD for any other delivery failure
     */
    virtual core::Result<void> AddDatapoints(const core::Context& ctx,
                                             std::vector<core::Datapoint> datapoints) = 0;
};

} // namespace sink
} // namespace prwingest
