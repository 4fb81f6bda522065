// PolyForest Core
// logger.hpp - Category-filtered logging on top of spdlog

#pragma once

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace polyforest::core {

// Same numbering as spdlog::level::level_enum
enum class LogLevel { Trace = 0, Debug, Info, Warn, Error, Critical, Off };

// "trace", "debug", "info", "warn"/"warning", "error", "critical" or "off", any case
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

struct LoggerConfig {
    LogLevel level = LogLevel::Info;  // Threshold for categories without their own level
    std::filesystem::path log_file;   // Empty = console only
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;
    bool colored_output = true;
};

// Process-wide logger. Every message belongs to a category (see log_category)
// and is dropped before formatting when below that category's level.
// Messages sent before initialize() go to spdlog's default logger.
class Logger {
public:
    static void initialize(const LoggerConfig& config = {});
    static void shutdown();  // Flushes and closes the log file
    [[nodiscard]] static bool is_initialized();

    static void set_category_level(std::string_view category, LogLevel level);
    [[nodiscard]] static LogLevel get_category_level(std::string_view category);

    template<typename... Args>
    static void log(LogLevel level, std::string_view category, fmt::format_string<Args...> format, Args&&... args) {
        if (enabled(level, category)) {
            write(level, category, fmt::format(format, std::forward<Args>(args)...));
        }
    }

private:
    Logger() = delete;

    [[nodiscard]] static bool enabled(LogLevel level, std::string_view category);
    static void write(LogLevel level, std::string_view category, std::string_view message);
};

namespace log_category {
    inline constexpr const char* ENGINE = "engine";
    inline constexpr const char* GEOMETRY = "geometry";
    inline constexpr const char* FOREST = "forest";
    inline constexpr const char* CONFIG = "config";
}  // namespace log_category

}  // namespace polyforest::core

#define POLYFOREST_LOG_TRACE(category, ...) \
    ::polyforest::core::Logger::log(::polyforest::core::LogLevel::Trace, category, __VA_ARGS__)
#define POLYFOREST_LOG_DEBUG(category, ...) \
    ::polyforest::core::Logger::log(::polyforest::core::LogLevel::Debug, category, __VA_ARGS__)
#define POLYFOREST_LOG_INFO(category, ...) \
    ::polyforest::core::Logger::log(::polyforest::core::LogLevel::Info, category, __VA_ARGS__)
#define POLYFOREST_LOG_WARN(category, ...) \
    ::polyforest::core::Logger::log(::polyforest::core::LogLevel::Warn, category, __VA_ARGS__)
#define POLYFOREST_LOG_ERROR(category, ...) \
    ::polyforest::core::Logger::log(::polyforest::core::LogLevel::Error, category, __VA_ARGS__)
#define POLYFOREST_LOG_CRITICAL(category, ...) \
    ::polyforest::core::Logger::log(::polyforest::core::LogLevel::Critical, category, __VA_ARGS__)
