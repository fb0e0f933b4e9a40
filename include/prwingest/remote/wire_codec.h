#pragma once

#include <string>

// Forward declarations for protobuf types
namespace prometheus {
class WriteRequest;
}

namespace prwingest {
namespace remote {

/**
 * @brief Snappy + protobuf codec for the remote-write payload
 */
class WireCodec {
public:
    /**
     * @brief Decompress a snappy block
     * @throws core::DecompressionError if the block is corrupt
     */
    static std::string Decompress(const std::string& compressed);

    /**
     * @brief Parse a decompressed body
     * @throws core::DeserializationError if the bytes are not a WriteRequest
     */
    static ::prometheus::WriteRequest Deserialize(const std::string& bytes);

    /**
     * @brief Decompress then parse an HTTP request body
     */
    static ::prometheus::WriteRequest Decode(const std::string& body);

    /**
     * @brief Serialize and snappy-compress a request, as a remote-write client does
     */
    static std::string Encode(const ::prometheus::WriteRequest& request);
};

} // namespace remote
} // namespace prwingest
