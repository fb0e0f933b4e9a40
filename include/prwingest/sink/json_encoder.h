#pragma once

#include "prwingest/core/types.h"
#include <string>
#include <vector>

namespace prwingest {
namespace sink {

/**
 * @brief JSON rendering shared by the HTTP sink and the /metrics endpoint
 *
 * `{"datapoints":[{"metric":"m","dimensions":{..},"value":5,"kind":"counter","timestamp_ns":1}]}`
 *
 * Integer values are JSON integers, floating point values JSON numbers;
 * infinities are written as the strings "+Inf" and "-Inf".
 */
class JsonEncoder {
public:
    static std::string EncodeDatapoints(const std::vector<core::Datapoint>& datapoints);

    static std::string EncodeError(const std::string& message);
};

} // namespace sink
} // namespace prwingest
