#ifndef TSDUMP_COMMON_LOGGER_H_
#define TSDUMP_COMMON_LOGGER_H_

#include <optional>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace tsdump {
namespace common {

class Logger {
public:
    /**
     * @brief Installs the default logger on stderr.
     *
     * Dump output owns stdout, so log lines never interleave with rows
     * that are piped into an import.
     */
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Maps "trace", "debug", "info", "warn", "error" or "off" to a level
     */
    static std::optional<spdlog::level::level_enum> ParseLevel(const std::string& name);
};

} // namespace common
} // namespace tsdump

// Macros for convenient logging
#define TSDUMP_TRACE(...) spdlog::trace(__VA_ARGS__)
#define TSDUMP_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define TSDUMP_INFO(...)  spdlog::info(__VA_ARGS__)
#define TSDUMP_WARN(...)  spdlog::warn(__VA_ARGS__)
#define TSDUMP_ERROR(...) spdlog::error(__VA_ARGS__)
#define TSDUMP_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // TSDUMP_COMMON_LOGGER_H_
