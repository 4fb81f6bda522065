// PolyForest - Low-poly forest generator
// main.cpp - Command-line entry point

#include <polyforest/app/command_line.hpp>
#include <polyforest/core/config.hpp>
#include <polyforest/core/logger.hpp>
#include <polyforest/core/random_source.hpp>
#include <polyforest/forest/forest_builder.hpp>
#include <polyforest/platform/file_io.hpp>
#include <polyforest/platform/timer.hpp>

#include <cstdio>
#include <optional>
#include <span>

namespace {

constexpr const char* VERSION = "0.1.0";

}  // namespace

int main(int argc, char* argv[]) {
    using namespace polyforest;

    const char* const* first_arg = argv + 1;
    const auto args = argc > 1 ? std::span<const char* const>(first_arg, static_cast<size_t>(argc - 1))
                               : std::span<const char* const>();
    auto cmd = app::parse_command_line(args);
    if (!cmd || cmd->show_help) {
        std::printf("PolyForest %s\n", VERSION);
        app::print_usage(argv[0]);
        return cmd ? 0 : 1;
    }

    core::Config config;
    if (cmd->config_path && !config.load_or_create_default(*cmd->config_path)) {
        return 1;
    }
    app::apply_overrides(*cmd, config);

    uint64_t seed = config.get_uint64(core::config_section::GENERATION, core::config_key::SEED, 0);
    if (seed == 0) {
        seed = core::SeededRandomSource::entropy_seed();
    }

    // One log file per seed, so a run can be found again and replayed
    const auto level_name = config.get_string(core::config_section::DEBUG, core::config_key::LOG_LEVEL, "info");
    core::LoggerConfig logger_config;
    logger_config.level = core::parse_log_level(level_name).value_or(core::LogLevel::Info);
    if (config.get_bool(core::config_section::DEBUG, core::config_key::LOG_TO_FILE, true)) {
        logger_config.log_file =
            platform::FileSystem::get_user_data_directory() / "logs" / fmt::format("forest-{}.log", seed);
    }
    core::Logger::initialize(logger_config);
    for (const auto& [category, level] : cmd->category_levels) {
        core::Logger::set_category_level(category, level);
    }

    POLYFOREST_LOG_INFO(core::log_category::ENGINE, "PolyForest {}", VERSION);
    POLYFOREST_LOG_INFO(core::log_category::ENGINE, "Seed: {}", seed);

    const auto generation = forest::GenerationConfig::from_config(config);
    const auto builder_config = forest::ForestBuilderConfig::from_config(config);

    core::SeededRandomSource rng(seed);
    forest::ForestBuilder builder(builder_config);

    std::optional<forest::Forest> result;
    {
        platform::ScopedTimer timing(core::log_category::FOREST,
                                     fmt::format("forest generation ({} trees)", generation.tree_count));
        result = builder.build(generation, rng);
    }

    if (!result) {
        POLYFOREST_LOG_ERROR(core::log_category::ENGINE, "Forest generation failed");
        core::Logger::shutdown();
        return 1;
    }

    const auto& stats = result->stats();
    POLYFOREST_LOG_INFO(core::log_category::ENGINE, "Scene buffer: {} vertices, {} triangles, {} colors",
                        result->vertices().size(), result->triangles().size(), result->colors().size());
    for (size_t i = 0; i < forest::TREE_ARCHETYPE_COUNT; ++i) {
        const auto archetype = static_cast<forest::TreeArchetype>(i);
        POLYFOREST_LOG_INFO(core::log_category::ENGINE, "  {:<8} {:>4} trees", forest::to_string(archetype),
                            stats.count(archetype));
    }
    POLYFOREST_LOG_INFO(core::log_category::ENGINE, "Generation time: {:.2f}ms", stats.generation_time_ms);

    core::Logger::shutdown();
    return 0;
}
