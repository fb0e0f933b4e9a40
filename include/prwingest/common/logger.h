#ifndef PRWINGEST_COMMON_LOGGER_H_
#define PRWINGEST_COMMON_LOGGER_H_

#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace prwingest {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Parse a level name (trace, debug, info, warn, error, off)
     * @throws core::InvalidArgumentError on an unknown name
     */
    static spdlog::level::level_enum ParseLevel(const std::string& name);
};

} // namespace common
} // namespace prwingest

// Macros for convenient logging
#define PRWINGEST_TRACE(...) spdlog::trace(__VA_ARGS__)
#define PRWINGEST_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define PRWINGEST_INFO(...)  spdlog::info(__VA_ARGS__)
#define PRWINGEST_WARN(...)  spdlog::warn(__VA_ARGS__)
#define PRWINGEST_ERROR(...) spdlog::error(__VA_ARGS__)
#define PRWINGEST_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // PRWINGEST_COMMON_LOGGER_H_
