#ifndef PRWINGEST_CORE_ERROR_H_
#define PRWINGEST_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace prwingest {
namespace core {

/**
 * @brief Base class for all receiver errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        READ = 2,
        DECOMPRESSION = 3,
        DESERIALIZATION = 4,
        SINK_FORWARD = 5,
        CANCELLED = 6,
        INTERNAL = 7
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

/**
 * @brief Error indicating invalid arguments or configuration
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief I/O failure while reading a request body
 */
class ReadError : public Error {
public:
    explicit ReadError(const std::string& message)
        : Error(message, Code::READ) {}
};

/**
 * @brief Request body is not a valid snappy block
 */
class DecompressionError : public Error {
public:
    explicit DecompressionError(const std::string& message)
        : Error(message, Code::DECOMPRESSION) {}
};

/**
 * @brief Decompressed body does not parse as a WriteRequest
 */
class DeserializationError : public Error {
public:
    explicit DeserializationError(const std::string& message)
        : Error(message, Code::DESERIALIZATION) {}
};

/**
 * @brief Downstream sink rejected or failed to accept a batch
 */
class SinkForwardError : public Error {
public:
    explicit SinkForwardError(const std::string& message)
        : Error(message, Code::SINK_FORWARD) {}
};

/**
 * @brief Request context was cancelled or hit its deadline before forwarding
 */
class CancelledError : public Error {
public:
    explicit CancelledError(const std::string& message)
        : Error(message, Code::CANCELLED) {}
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
};

/**
 * @brief HTTP status reported to a remote-write client for an error code
 *
 * Malformed payloads are the client's fault (400); everything else is 500.
 */
int HttpStatusFor(Error::Code code);

const char* CodeName(Error::Code code);

} // namespace core
} // namespace prwingest

#endif // PRWINGEST_CORE_ERROR_H_
