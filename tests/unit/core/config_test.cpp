// PolyForest Core Tests
// config_test.cpp - JSON settings store tests

#include <gtest/gtest.h>

#include <polyforest/core/config.hpp>
#include <polyforest/platform/file_io.hpp>

#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>

namespace polyforest::core {
namespace {

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir_;

    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "polyforest_config_test";
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }
};

TEST_F(ConfigTest, DefaultsPresent) {
    Config config;
    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::TREE_COUNT), 100);
    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::PLOT_SIZE), 120);
    EXPECT_EQ(config.get_uint64(config_section::GENERATION, config_key::SEED, 99), 0u);
    EXPECT_DOUBLE_EQ(config.get_double(config_section::GENERATION, config_key::OVERLAP), 0.5);
    EXPECT_EQ(config.get_int(config_section::PERFORMANCE, config_key::WORKER_THREADS), 1);
    EXPECT_EQ(config.get_string(config_section::DEBUG, config_key::LOG_LEVEL), "info");
    EXPECT_TRUE(config.get_bool(config_section::DEBUG, config_key::LOG_TO_FILE));
    EXPECT_TRUE(config.get_bool(config_section::DEBUG, config_key::ENFORCE_RECOGNIZED_RANGES));
}

TEST_F(ConfigTest, MissingKeyReturnsDefault) {
    Config config;
    EXPECT_EQ(config.get_int("nowhere", "nothing", 17), 17);
    EXPECT_EQ(config.get_string(config_section::GENERATION, "missing", "fallback"), "fallback");
}

TEST_F(ConfigTest, WrongTypeReturnsDefault) {
    Config config;
    config.set_string(config_section::GENERATION, config_key::TREE_COUNT, "lots");
    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::TREE_COUNT, 55), 55);
    EXPECT_FALSE(config.get_bool(config_section::GENERATION, config_key::TREE_COUNT, false));
}

TEST_F(ConfigTest, FractionalValueIsNotAnInteger) {
    Config config;
    ASSERT_TRUE(config.load_from_string(R"({"generation": {"tree_count": 2.5, "plot_size": 1e12}})"));

    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::TREE_COUNT, 55), 55);
    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::PLOT_SIZE, 80), 80);
}

TEST_F(ConfigTest, IntegerOutsideIntRangeReturnsDefault) {
    Config config;
    ASSERT_TRUE(config.load_from_string(R"({"generation": {"tree_count": 4294967296, "plot_size": -3000000000}})"));

    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::TREE_COUNT, 55), 55);
    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::PLOT_SIZE, 80), 80);
}

TEST_F(ConfigTest, IntegersConvertToDouble) {
    Config config;
    ASSERT_TRUE(config.load_from_string(R"({"generation": {"overlap": 1}})"));
    EXPECT_DOUBLE_EQ(config.get_double(config_section::GENERATION, config_key::OVERLAP), 1.0);
}

TEST_F(ConfigTest, SeedKeepsAllSixtyFourBits) {
    Config config;
    ASSERT_TRUE(config.load_from_string(R"({"generation": {"seed": 18000000000000000000}})"));
    EXPECT_EQ(config.get_uint64(config_section::GENERATION, config_key::SEED), 18000000000000000000ull);

    config.set_uint64(config_section::GENERATION, config_key::SEED, std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(config.get_uint64(config_section::GENERATION, config_key::SEED),
              std::numeric_limits<uint64_t>::max());
}

TEST_F(ConfigTest, NegativeOrFloatingSeedReturnsDefault) {
    Config config;
    ASSERT_TRUE(config.load_from_string(R"({"generation": {"seed": -5}})"));
    EXPECT_EQ(config.get_uint64(config_section::GENERATION, config_key::SEED, 7), 7u);

    ASSERT_TRUE(config.load_from_string(R"({"generation": {"seed": 1e30}})"));
    EXPECT_EQ(config.get_uint64(config_section::GENERATION, config_key::SEED, 7), 7u);
}

TEST_F(ConfigTest, LoadFromStringOverridesOnlyGivenKeys) {
    Config config;
    ASSERT_TRUE(config.load_from_string(R"({"generation": {"tree_count": 250}})"));

    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::TREE_COUNT), 250);
    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::PLOT_SIZE), 120);
    EXPECT_EQ(config.get_string(config_section::DEBUG, config_key::LOG_LEVEL), "info");
}

TEST_F(ConfigTest, RejectedDocumentKeepsCurrentSettings) {
    Config config;
    config.set_int(config_section::GENERATION, config_key::TREE_COUNT, 42);

    EXPECT_FALSE(config.load_from_string("{ not json"));
    EXPECT_FALSE(config.load_from_string("[1, 2, 3]"));
    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::TREE_COUNT), 42);
}

TEST_F(ConfigTest, SaveAndLoadRoundTrip) {
    const auto path = test_dir_ / "settings.json";

    Config original;
    original.set_int(config_section::GENERATION, config_key::TREE_COUNT, 75);
    original.set_uint64(config_section::GENERATION, config_key::SEED, 1311768467463790321ull);
    original.set_string(config_section::DEBUG, config_key::LOG_LEVEL, "debug");
    ASSERT_TRUE(original.save(path));

    Config loaded;
    ASSERT_TRUE(loaded.load(path));
    EXPECT_EQ(loaded.get_int(config_section::GENERATION, config_key::TREE_COUNT), 75);
    EXPECT_EQ(loaded.get_uint64(config_section::GENERATION, config_key::SEED), 1311768467463790321ull);
    EXPECT_EQ(loaded.get_string(config_section::DEBUG, config_key::LOG_LEVEL), "debug");
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    Config config;
    EXPECT_FALSE(config.load(test_dir_ / "absent.json"));
    EXPECT_EQ(config.get_int(config_section::GENERATION, config_key::TREE_COUNT), 100);
}

TEST_F(ConfigTest, LoadOrCreateDefaultWritesFile) {
    const auto path = test_dir_ / "nested" / "settings.json";

    Config config;
    ASSERT_TRUE(config.load_or_create_default(path));
    EXPECT_TRUE(platform::FileSystem::exists(path));

    auto text = platform::FileSystem::read_text(path);
    ASSERT_TRUE(text.has_value());
    EXPECT_NE(text->find("\"tree_count\": 100"), std::string::npos);
}

TEST_F(ConfigTest, LoadOrCreateDefaultReadsExistingFile) {
    const auto path = test_dir_ / "settings.json";
    ASSERT_TRUE(platform::FileSystem::write_text(path, R"({"performance": {"worker_threads": 4}})"));

    Config config;
    ASSERT_TRUE(config.load_or_create_default(path));
    EXPECT_EQ(config.get_int(config_section::PERFORMANCE, config_key::WORKER_THREADS), 4);
}

}  // namespace
}  // namespace polyforest::core
