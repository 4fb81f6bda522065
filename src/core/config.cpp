// PolyForest Core
// config.cpp - JSON-backed generator settings

#include <nlohmann/json.hpp>

#include <polyforest/core/config.hpp>
#include <polyforest/core/logger.hpp>
#include <polyforest/platform/file_io.hpp>

#include <optional>
#include <type_traits>
#include <utility>

namespace polyforest::core {

using json = nlohmann::json;

namespace {

json default_settings() {
    return json{{config_section::GENERATION,
                 {{config_key::TREE_COUNT, 100},
                  {config_key::PLOT_SIZE, 120},
                  {config_key::SEED, 0},
                  {config_key::OVERLAP, 0.5}}},
                {config_section::PERFORMANCE, {{config_key::WORKER_THREADS, 1}}},
                {config_section::DEBUG,
                 {{config_key::LOG_LEVEL, "info"},
                  {config_key::LOG_TO_FILE, true},
                  {config_key::ENFORCE_RECOGNIZED_RANGES, true}}}};
}

// Integer JSON value that fits T exactly; floats never qualify
template<typename T>
std::optional<T> exact_integer(const json& value) {
    if (value.is_number_unsigned()) {
        const auto n = value.get<uint64_t>();
        if (std::in_range<T>(n)) {
            return static_cast<T>(n);
        }
    } else if (value.is_number_integer()) {
        const auto n = value.get<int64_t>();
        if (std::in_range<T>(n)) {
            return static_cast<T>(n);
        }
    }
    return std::nullopt;
}

}  // namespace

struct Config::Impl {
    json settings = default_settings();

    [[nodiscard]] const json* lookup(std::string_view section, std::string_view key) const {
        auto section_it = settings.find(std::string(section));
        if (section_it == settings.end() || !section_it->is_object()) {
            return nullptr;
        }
        auto key_it = section_it->find(std::string(key));
        return key_it == section_it->end() ? nullptr : &*key_it;
    }

    template<typename T>
    [[nodiscard]] std::optional<T> read(std::string_view section, std::string_view key) const {
        const json* value = lookup(section, key);
        if (value == nullptr) {
            return std::nullopt;
        }

        std::optional<T> result;
        if constexpr (std::is_same_v<T, bool>) {
            if (value->is_boolean()) {
                result = value->get<bool>();
            }
        } else if constexpr (std::is_integral_v<T>) {
            result = exact_integer<T>(*value);
        } else if constexpr (std::is_floating_point_v<T>) {
            if (value->is_number()) {
                result = value->get<T>();
            }
        } else if (value->is_string()) {
            result = value->get<std::string>();
        }

        if (!result) {
            POLYFOREST_LOG_WARN(log_category::CONFIG, "Ignoring {}.{} = {}: wrong type or out of range", section, key,
                                value->dump());
        }
        return result;
    }

    template<typename T>
    void assign(std::string_view section, std::string_view key, T&& value) {
        settings[std::string(section)][std::string(key)] = std::forward<T>(value);
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        POLYFOREST_LOG_ERROR(log_category::CONFIG, "Cannot read settings file {}", path.string());
        return false;
    }
    if (!load_from_string(*content)) {
        POLYFOREST_LOG_ERROR(log_category::CONFIG, "Settings file {} was not applied", path.string());
        return false;
    }
    POLYFOREST_LOG_INFO(log_category::CONFIG, "Settings loaded from {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view content) {
    json parsed = json::parse(content, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        POLYFOREST_LOG_ERROR(log_category::CONFIG, "Settings must be a JSON object");
        return false;
    }

    // Keys absent from the document keep their defaults
    json merged = default_settings();
    merged.merge_patch(parsed);
    impl_->settings = std::move(merged);
    return true;
}

bool Config::save(const std::filesystem::path& path) const {
    if (!platform::FileSystem::write_text(path, impl_->settings.dump(4) + "\n")) {
        POLYFOREST_LOG_ERROR(log_category::CONFIG, "Cannot write settings file {}", path.string());
        return false;
    }
    POLYFOREST_LOG_INFO(log_category::CONFIG, "Settings written to {}", path.string());
    return true;
}

bool Config::load_or_create_default(const std::filesystem::path& path) {
    if (platform::FileSystem::exists(path)) {
        return load(path);
    }

    impl_->settings = default_settings();
    if (!save(path)) {
        POLYFOREST_LOG_WARN(log_category::CONFIG, "Continuing with built-in defaults");
    }
    return true;
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    return impl_->read<int>(section, key).value_or(default_value);
}

uint64_t Config::get_uint64(std::string_view section, std::string_view key, uint64_t default_value) const {
    return impl_->read<uint64_t>(section, key).value_or(default_value);
}

double Config::get_double(std::string_view section, std::string_view key, double default_value) const {
    return impl_->read<double>(section, key).value_or(default_value);
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    return impl_->read<bool>(section, key).value_or(default_value);
}

std::string Config::get_string(std::string_view section, std::string_view key, std::string_view default_value) const {
    return impl_->read<std::string>(section, key).value_or(std::string(default_value));
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->assign(section, key, value);
}

void Config::set_uint64(std::string_view section, std::string_view key, uint64_t value) {
    impl_->assign(section, key, value);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->assign(section, key, std::string(value));
}

}  // namespace polyforest::core
