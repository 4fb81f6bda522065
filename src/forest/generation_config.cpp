// PolyForest Forest Generation
// generation_config.cpp - Generation parameter loading and validation

#include <polyforest/core/config.hpp>
#include <polyforest/forest/generation_config.hpp>

namespace polyforest::forest {

GenerationConfig GenerationConfig::from_config(const core::Config& config) {
    GenerationConfig result;
    result.tree_count =
        config.get_int(core::config_section::GENERATION, core::config_key::TREE_COUNT, DEFAULT_TREE_COUNT);
    result.plot_size =
        config.get_int(core::config_section::GENERATION, core::config_key::PLOT_SIZE, DEFAULT_PLOT_SIZE);
    return result;
}

const char* to_string(ConfigError error) {
    switch (error) {
        case ConfigError::None:
            return "none";
        case ConfigError::TreeCountOutOfRange:
            return "tree count outside recognized range 20-300";
        case ConfigError::PlotSizeOutOfRange:
            return "plot size outside recognized range 50-200";
        case ConfigError::NegativeTreeCount:
            return "tree count is negative";
        case ConfigError::NonPositivePlotSize:
            return "plot size must be positive";
        case ConfigError::NegativeOverlap:
            return "stack overlap is negative";
        default:
            return "unknown";
    }
}

ConfigError validate(const GenerationConfig& config, bool enforce_recognized_ranges) {
    if (config.tree_count < 0) {
        return ConfigError::NegativeTreeCount;
    }
    if (config.plot_size <= 0) {
        return ConfigError::NonPositivePlotSize;
    }
    if (!enforce_recognized_ranges) {
        return ConfigError::None;
    }
    if (config.tree_count < MIN_TREE_COUNT || config.tree_count > MAX_TREE_COUNT) {
        return ConfigError::TreeCountOutOfRange;
    }
    if (config.plot_size < MIN_PLOT_SIZE || config.plot_size > MAX_PLOT_SIZE) {
        return ConfigError::PlotSizeOutOfRange;
    }
    return ConfigError::None;
}

}  // namespace polyforest::forest
