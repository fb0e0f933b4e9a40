#include "prwingest/core/context.h"

namespace prwingest {
namespace core {

Context::Context()
    : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

Context Context::WithTimeout(std::chrono::milliseconds timeout) {
    return WithDeadline(Clock::now() + timeout);
}

Context Context::WithDeadline(Clock::time_point deadline) {
    Context ctx;
    ctx.deadline_ = deadline;
    return ctx;
}

void Context::Cancel() {
    cancelled_->store(true);
}

bool Context::IsDone() const {
    if (cancelled_->load()) {
        return true;
    }
    return deadline_ && Clock::now() >= *deadline_;
}

std::optional<std::chrono::milliseconds> Context::Remaining() const {
    if (!deadline_) {
        return std::nullopt;
    }
    if (cancelled_->load()) {
        return std::chrono::milliseconds(0);
    }
    // Rounded up: a deadline less than 1ms away is not yet reported as zero.
    auto left = std::chrono::ceil<std::chrono::milliseconds>(*deadline_ - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

} // namespace core
} // namespace prwingest
