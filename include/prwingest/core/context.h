#ifndef PRWINGEST_CORE_CONTEXT_H_
#define PRWINGEST_CORE_CONTEXT_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace prwingest {
namespace core {

/**
 * @brief Cancellation scope for one request
 *
 * Copies share the cancellation flag, so a copy handed to a sink observes
 * Cancel() on the original. The deadline is fixed at construction.
 */
class Context {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Context with no deadline that is only cancelled explicitly
     */
    Context();

    static Context WithTimeout(std::chrono::milliseconds timeout);
    static Context WithDeadline(Clock::time_point deadline);

    void Cancel();

    /**
     * @brief True once Cancel() was called or the deadline passed
     */
    bool IsDone() const;

    const std::optional<Clock::time_point>& deadline() const { return deadline_; }

    /**
     * @brief Time left before the deadline, zero when done
     *
     * Returns std::nullopt when there is no deadline.
     */
    std::optional<std::chrono::milliseconds> Remaining() const;

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
    std::optional<Clock::time_point> deadline_;
};

} // namespace core
} // namespace prwingest

#endif // PRWINGEST_CORE_CONTEXT_H_
