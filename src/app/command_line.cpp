// PolyForest Application
// command_line.cpp - Generator flags and how they override file settings

#include <polyforest/app/command_line.hpp>
#include <polyforest/core/config.hpp>

#include <charconv>
#include <cstdio>
#include <string_view>

namespace polyforest::app {

namespace {

template<typename T>
[[nodiscard]] std::optional<T> parse_number(std::string_view text) {
    T value{};
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

// Either a bare level or <category>=<level>
[[nodiscard]] bool parse_level_option(std::string_view value, CommandLine& cmd) {
    const auto separator = value.find('=');
    if (separator == std::string_view::npos) {
        cmd.log_level = std::string(value);
        return core::parse_log_level(value).has_value();
    }

    const auto category = value.substr(0, separator);
    const auto level = core::parse_log_level(value.substr(separator + 1));
    if (category.empty() || !level) {
        return false;
    }
    cmd.category_levels.emplace_back(std::string(category), *level);
    return true;
}

}  // namespace

std::optional<CommandLine> parse_command_line(std::span<const char* const> args) {
    CommandLine cmd;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i];

        if (arg == "--help" || arg == "-h") {
            cmd.show_help = true;
            continue;
        }

        if (i + 1 >= args.size()) {
            std::fprintf(stderr, "Missing value for %s\n", args[i]);
            return std::nullopt;
        }
        const std::string_view value = args[++i];

        bool ok = true;
        if (arg == "--config") {
            cmd.config_path = std::string(value);
        } else if (arg == "--trees") {
            cmd.tree_count = parse_number<int>(value);
            ok = cmd.tree_count.has_value();
        } else if (arg == "--plot-size") {
            cmd.plot_size = parse_number<int>(value);
            ok = cmd.plot_size.has_value();
        } else if (arg == "--seed") {
            // from_chars rejects a leading '-' for unsigned types
            cmd.seed = parse_number<uint64_t>(value);
            ok = cmd.seed.has_value();
        } else if (arg == "--threads") {
            cmd.worker_threads = parse_number<int>(value);
            ok = cmd.worker_threads.has_value() && *cmd.worker_threads > 0;
        } else if (arg == "--log-level") {
            ok = parse_level_option(value, cmd);
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", args[i - 1]);
            return std::nullopt;
        }

        if (!ok) {
            std::fprintf(stderr, "Invalid value for %s: %s\n", args[i - 1], args[i]);
            return std::nullopt;
        }
    }

    return cmd;
}

void apply_overrides(const CommandLine& cmd, core::Config& config) {
    using namespace core;

    if (cmd.tree_count) {
        config.set_int(config_section::GENERATION, config_key::TREE_COUNT, *cmd.tree_count);
    }
    if (cmd.plot_size) {
        config.set_int(config_section::GENERATION, config_key::PLOT_SIZE, *cmd.plot_size);
    }
    if (cmd.seed) {
        config.set_uint64(config_section::GENERATION, config_key::SEED, *cmd.seed);
    }
    if (cmd.worker_threads) {
        config.set_int(config_section::PERFORMANCE, config_key::WORKER_THREADS, *cmd.worker_threads);
    }
    if (cmd.log_level) {
        config.set_string(config_section::DEBUG, config_key::LOG_LEVEL, *cmd.log_level);
    }
}

void print_usage(const char* program) {
    std::printf(
        "Usage: %s [options]\n"
        "  --config <path>      JSON settings file (created with defaults if missing)\n"
        "  --trees <n>          Number of trees (20-300)\n"
        "  --plot-size <n>      Plot width (50-200)\n"
        "  --seed <n>           Random seed (unsigned 64-bit), 0 picks one at random\n"
        "  --threads <n>        Worker threads for tree construction\n"
        "  --log-level <level>  trace, debug, info, warn, error, critical, off\n"
        "  --log-level <category>=<level>\n"
        "                       Per-category level (engine, geometry, forest, config)\n"
        "  --help               Show this message\n",
        program);
}

}  // namespace polyforest::app
