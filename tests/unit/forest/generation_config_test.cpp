// PolyForest Forest Tests
// generation_config_test.cpp - Parameter validation tests

#include <gtest/gtest.h>

#include <polyforest/core/config.hpp>
#include <polyforest/forest/generation_config.hpp>
#include <string>

namespace polyforest::forest {
namespace {

GenerationConfig make(int32_t trees, int32_t plot) {
    GenerationConfig config;
    config.tree_count = trees;
    config.plot_size = plot;
    return config;
}

TEST(GenerationConfigTest, DefaultsAreValid) {
    GenerationConfig config;
    EXPECT_EQ(config.tree_count, 100);
    EXPECT_EQ(config.plot_size, 120);
    EXPECT_EQ(validate(config), ConfigError::None);
}

TEST(GenerationConfigTest, AcceptsRangeBoundaries) {
    EXPECT_EQ(validate(make(20, 50)), ConfigError::None);
    EXPECT_EQ(validate(make(300, 200)), ConfigError::None);
}

TEST(GenerationConfigTest, RejectsTreeCountOutsideRange) {
    EXPECT_EQ(validate(make(19, 100)), ConfigError::TreeCountOutOfRange);
    EXPECT_EQ(validate(make(301, 100)), ConfigError::TreeCountOutOfRange);
    EXPECT_EQ(validate(make(0, 100)), ConfigError::TreeCountOutOfRange);
}

TEST(GenerationConfigTest, RejectsPlotSizeOutsideRange) {
    EXPECT_EQ(validate(make(100, 49)), ConfigError::PlotSizeOutOfRange);
    EXPECT_EQ(validate(make(100, 201)), ConfigError::PlotSizeOutOfRange);
}

TEST(GenerationConfigTest, RelaxedModeAcceptsSmallScenes) {
    EXPECT_EQ(validate(make(0, 100), false), ConfigError::None);
    EXPECT_EQ(validate(make(1, 100), false), ConfigError::None);
    EXPECT_EQ(validate(make(1000, 10), false), ConfigError::None);
}

TEST(GenerationConfigTest, AlwaysRejectsImpossibleValues) {
    EXPECT_EQ(validate(make(-1, 100), false), ConfigError::NegativeTreeCount);
    EXPECT_EQ(validate(make(10, 0), false), ConfigError::NonPositivePlotSize);
    EXPECT_EQ(validate(make(10, -50), false), ConfigError::NonPositivePlotSize);
    EXPECT_EQ(validate(make(-1, 100)), ConfigError::NegativeTreeCount);
}

TEST(GenerationConfigTest, NeverClamps) {
    GenerationConfig config = make(500, 100);
    EXPECT_NE(validate(config), ConfigError::None);
    EXPECT_EQ(config.tree_count, 500);
}

TEST(GenerationConfigTest, ReadsGenerationSection) {
    core::Config settings;
    ASSERT_TRUE(settings.load_from_string(R"({"generation": {"tree_count": 42, "plot_size": 75}})"));

    GenerationConfig config = GenerationConfig::from_config(settings);
    EXPECT_EQ(config.tree_count, 42);
    EXPECT_EQ(config.plot_size, 75);
}

TEST(GenerationConfigTest, ErrorsHaveReadableNames) {
    EXPECT_EQ(std::string(to_string(ConfigError::None)), "none");
    EXPECT_NE(std::string(to_string(ConfigError::TreeCountOutOfRange)).find("20-300"), std::string::npos);
    EXPECT_NE(std::string(to_string(ConfigError::PlotSizeOutOfRange)).find("50-200"), std::string::npos);
    EXPECT_EQ(std::string(to_string(ConfigError::NegativeOverlap)), "stack overlap is negative");
}

}  // namespace
}  // namespace polyforest::forest
