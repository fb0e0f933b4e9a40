#include "prwingest/core/error.h"

namespace prwingest {
namespace core {

int HttpStatusFor(Error::Code code) {
    switch (code) {
        case Error::Code::DECOMPRESSION:
        case Error::Code::DESERIALIZATION:
        case Error::Code::INVALID_ARGUMENT:
            return 400;
        case Error::Code::READ:
        case Error::Code::SINK_FORWARD:
        case Error::Code::CANCELLED:
        case Error::Code::INTERNAL:
        case Error::Code::UNKNOWN:
            return 500;
    }
    return 500;
}

const char* CodeName(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN: return "UNKNOWN";
        case Error::Code::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case Error::Code::READ: return "READ";
        case Error::Code::DECOMPRESSION: return "DECOMPRESSION";
        case Error::Code::DESERIALIZATION: return "DESERIALIZATION";
        case Error::Code::SINK_FORWARD: return "SINK_FORWARD";
        case Error::Code::CANCELLED: return "CANCELLED";
        case Error::Code::INTERNAL: return "INTERNAL";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace prwingest
