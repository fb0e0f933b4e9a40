#ifndef PRWINGEST_CORE_RESULT_H_
#define PRWINGEST_CORE_RESULT_H_

#include <string>
#include <optional>
#include <stdexcept>
#include "prwingest/core/error.h"

namespace prwingest {
namespace core {

/**
 * @brief Outcome of a call whose failure is expected, e.g. a downstream sink
 *
 * A failed result carries a message and an Error::Code, so callers can
 * escalate it with the right HTTP status:
 * ```
 * auto result = sink->AddDatapoints(ctx, std::move(batch));
 * if (!result.ok() && result.code() == Error::Code::CANCELLED) {
 *     ...
 * }
 * ```
 */
template<typename T>
class Result;

/**
 * @brief Specialization for calls that produce no value
 */
template<>
class Result<void> {
public:
    Result() = default;

    bool ok() const { return !failure_.has_value(); }

    std::string error() const {
        if (!failure_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return failure_->message;
    }

    Error::Code code() const {
        return failure_ ? failure_->code : Error::Code::UNKNOWN;
    }

    static Result<void> error(const std::string& message, Error::Code code = Error::Code::UNKNOWN) {
        Result<void> result;
        result.failure_ = Failure{message, code};
        return result;
    }

private:
    struct Failure {
        std::string message;
        Error::Code code;
    };

    std::optional<Failure> failure_;
};

} // namespace core
} // namespace prwingest

#endif // PRWINGEST_CORE_RESULT_H_
