// PolyForest Application
// command_line.hpp - Generator flags and how they override file settings

#pragma once

#include <polyforest/core/logger.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace polyforest::core {
class Config;
}

namespace polyforest::app {

struct CommandLine {
    std::optional<std::string> config_path;
    std::optional<int> tree_count;
    std::optional<int> plot_size;
    std::optional<uint64_t> seed;
    std::optional<int> worker_threads;
    std::optional<std::string> log_level;
    std::vector<std::pair<std::string, core::LogLevel>> category_levels;  // --log-level <category>=<level>
    bool show_help = false;
};

// `args` excludes the program name. Malformed input is reported on stderr
// and yields nullopt.
[[nodiscard]] std::optional<CommandLine> parse_command_line(std::span<const char* const> args);

// Flags win over file settings
void apply_overrides(const CommandLine& cmd, core::Config& config);

void print_usage(const char* program);

}  // namespace polyforest::app
