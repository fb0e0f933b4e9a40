#include "prwingest/remote/wire_codec.h"
#include "prwingest/core/error.h"
#include "remote.pb.h"
#include <snappy.h>

namespace prwingest {
namespace remote {

std::string WireCodec::Decompress(const std::string& compressed) {
    std::string decompressed;
    if (!snappy::Uncompress(compressed.data(), compressed.size(), &decompressed)) {
        throw core::DecompressionError("snappy: corrupt input (" +
                                       std::to_string(compressed.size()) + " bytes)");
    }
    return decompressed;
}

::prometheus::WriteRequest WireCodec::Deserialize(const std::string& bytes) {
    ::prometheus::WriteRequest request;
    if (!request.ParseFromString(bytes)) {
        throw core::DeserializationError("proto: cannot parse WriteRequest (" +
                                         std::to_string(bytes.size()) + " bytes)");
    }
    return request;
}

::prometheus::WriteRequest WireCodec::Decode(const std::string& body) {
    return Deserialize(Decompress(body));
}

std::string WireCodec::Encode(const ::prometheus::WriteRequest& request) {
    std::string serialized;
    if (!request.SerializeToString(&serialized)) {
        throw core::InternalError("proto: cannot serialize WriteRequest");
    }
    std::string compressed;
    snappy::Compress(serialized.data(), serialized.size(), &compressed);
    return compressed;
}

} // namespace remote
} // namespace prwingest
