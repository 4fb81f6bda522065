// PolyForest Core
// logger.cpp - Category-filtered logging on top of spdlog

#include <polyforest/core/logger.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace polyforest::core {

namespace {

struct LoggerState {
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> output;  // Null until initialize()
    LogLevel global_level = LogLevel::Info;
    std::map<std::string, LogLevel, std::less<>> category_levels;
};

LoggerState& state() {
    static LoggerState instance;
    return instance;
}

constexpr std::array<std::pair<std::string_view, LogLevel>, 8> LEVEL_NAMES = {{
    {"trace", LogLevel::Trace},
    {"debug", LogLevel::Debug},
    {"info", LogLevel::Info},
    {"warn", LogLevel::Warn},
    {"warning", LogLevel::Warn},
    {"error", LogLevel::Error},
    {"critical", LogLevel::Critical},
    {"off", LogLevel::Off},
}};

bool equals_ignore_case(std::string_view a, std::string_view b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

spdlog::level::level_enum to_spdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(static_cast<int>(level));
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    for (const auto& [text, level] : LEVEL_NAMES) {
        if (equals_ignore_case(name, text)) {
            return level;
        }
    }
    return std::nullopt;
}

void Logger::initialize(const LoggerConfig& config) {
    if (is_initialized()) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;
    if (config.colored_output) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    } else {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
    }
    sinks.back()->set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::string file_error;
    if (!config.log_file.empty()) {
        try {
            // spdlog creates missing parent directories
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_file.string(), config.max_file_size, config.max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(std::move(file_sink));
        } catch (const spdlog::spdlog_ex& ex) {
            file_error = ex.what();
        }
    }

    {
        auto& s = state();
        std::lock_guard lock(s.mutex);
        s.output = std::make_shared<spdlog::logger>("polyforest", sinks.begin(), sinks.end());
        s.output->set_level(spdlog::level::trace);  // Filtering happens per category
        s.output->flush_on(spdlog::level::warn);
        s.global_level = config.level;
    }

    if (!file_error.empty()) {
        POLYFOREST_LOG_WARN(log_category::ENGINE, "Logging to console only, cannot open {}: {}",
                            config.log_file.string(), file_error);
    } else if (!config.log_file.empty()) {
        POLYFOREST_LOG_DEBUG(log_category::ENGINE, "Log file: {}", config.log_file.string());
    }
}

void Logger::shutdown() {
    std::shared_ptr<spdlog::logger> output;
    {
        auto& s = state();
        std::lock_guard lock(s.mutex);
        output = std::move(s.output);
        s.category_levels.clear();
        s.global_level = LogLevel::Info;
    }
    if (output) {
        output->flush();
    }
}

bool Logger::is_initialized() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.output != nullptr;
}

void Logger::set_category_level(std::string_view category, LogLevel level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.category_levels.insert_or_assign(std::string(category), level);
}

LogLevel Logger::get_category_level(std::string_view category) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    auto it = s.category_levels.find(category);
    return it != s.category_levels.end() ? it->second : s.global_level;
}

bool Logger::enabled(LogLevel level, std::string_view category) {
    return level != LogLevel::Off && level >= get_category_level(category);
}

void Logger::write(LogLevel level, std::string_view category, std::string_view message) {
    std::shared_ptr<spdlog::logger> output;
    {
        auto& s = state();
        std::lock_guard lock(s.mutex);
        output = s.output;
    }
    if (!output) {
        output = spdlog::default_logger();
    }
    output->log(to_spdlog(level), "[{}] {}", category, message);
}

}  // namespace polyforest::core
