// PolyForest Forest Generation
// generation_config.hpp - User-facing generation parameters and validation

#pragma once

#include <cstdint>

namespace polyforest::core {
class Config;
}

namespace polyforest::forest {

// Recognized parameter ranges (inclusive)
inline constexpr int32_t MIN_TREE_COUNT = 20;
inline constexpr int32_t MAX_TREE_COUNT = 300;
inline constexpr int32_t DEFAULT_TREE_COUNT = 100;

inline constexpr int32_t MIN_PLOT_SIZE = 50;
inline constexpr int32_t MAX_PLOT_SIZE = 200;
inline constexpr int32_t DEFAULT_PLOT_SIZE = 120;

struct GenerationConfig {
    int32_t tree_count = DEFAULT_TREE_COUNT;
    int32_t plot_size = DEFAULT_PLOT_SIZE;  // Trees land in [-plot_size/2, plot_size/2]^2

    // Read the "generation" section; missing keys keep their defaults
    [[nodiscard]] static GenerationConfig from_config(const core::Config& config);
};

enum class ConfigError : uint8_t {
    None = 0,
    TreeCountOutOfRange,  // Outside [MIN_TREE_COUNT, MAX_TREE_COUNT]
    PlotSizeOutOfRange,   // Outside [MIN_PLOT_SIZE, MAX_PLOT_SIZE]
    NegativeTreeCount,
    NonPositivePlotSize,
    NegativeOverlap,
};

[[nodiscard]] const char* to_string(ConfigError error);

// Check a configuration before generation. Negative tree counts and
// non-positive plot sizes are always rejected; the recognized ranges only
// when enforce_recognized_ranges is set. Values are never clamped.
[[nodiscard]] ConfigError validate(const GenerationConfig& config, bool enforce_recognized_ranges = true);

}  // namespace polyforest::forest
