// PolyForest Core
// config.hpp - JSON-backed generator settings

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace polyforest::core {

// Two-level (section -> key -> value) settings. Starts from the built-in
// defaults; loading overlays a JSON object on top of them.
class Config {
public:
    Config();
    ~Config();

    // Non-copyable but movable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    // On failure the current settings are kept
    bool load(const std::filesystem::path& path);
    bool load_from_string(std::string_view content);

    bool save(const std::filesystem::path& path) const;

    // Load `path`, or write the defaults there if it does not exist yet
    bool load_or_create_default(const std::filesystem::path& path);

    // Missing keys, values of another JSON type and integers outside the
    // target type's range all yield `default_value`
    [[nodiscard]] int get_int(std::string_view section, std::string_view key, int default_value = 0) const;
    [[nodiscard]] uint64_t get_uint64(std::string_view section, std::string_view key,
                                      uint64_t default_value = 0) const;
    [[nodiscard]] double get_double(std::string_view section, std::string_view key,
                                    double default_value = 0.0) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                         std::string_view default_value = "") const;

    void set_int(std::string_view section, std::string_view key, int value);
    void set_uint64(std::string_view section, std::string_view key, uint64_t value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

namespace config_section {
    inline constexpr const char* GENERATION = "generation";
    inline constexpr const char* PERFORMANCE = "performance";
    inline constexpr const char* DEBUG = "debug";
}  // namespace config_section

namespace config_key {
    // Generation section
    inline constexpr const char* TREE_COUNT = "tree_count";
    inline constexpr const char* PLOT_SIZE = "plot_size";
    inline constexpr const char* SEED = "seed";  // 0 = pick one at random
    inline constexpr const char* OVERLAP = "overlap";

    // Performance section
    inline constexpr const char* WORKER_THREADS = "worker_threads";

    // Debug section
    inline constexpr const char* LOG_LEVEL = "log_level";
    inline constexpr const char* LOG_TO_FILE = "log_to_file";
    inline constexpr const char* ENFORCE_RECOGNIZED_RANGES = "enforce_recognized_ranges";
}  // namespace config_key

}  // namespace polyforest::core
