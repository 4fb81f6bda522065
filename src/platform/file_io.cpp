// PolyForest Platform Layer
// file_io.cpp - Settings and log file locations, whole-file text I/O

#include <polyforest/platform/file_io.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

#if defined(POLYFOREST_PLATFORM_WINDOWS)
#include <shlobj.h>
#include <windows.h>
#else
#include <pwd.h>
#include <unistd.h>
#endif

namespace polyforest::platform {

namespace {

constexpr const char* APP_DIRECTORY = "PolyForest";

// Value of a non-empty environment variable
std::optional<fs::path> env_path(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return fs::path(value);
}

#if !defined(POLYFOREST_PLATFORM_WINDOWS)
fs::path home_directory() {
    if (auto home = env_path("HOME")) {
        return *home;
    }
    if (const passwd* entry = getpwuid(getuid()); entry != nullptr) {
        return fs::path(entry->pw_dir);
    }
    return fs::current_path();
}
#endif

}  // namespace

fs::path FileSystem::get_user_data_directory() {
#if defined(POLYFOREST_PLATFORM_WINDOWS)
    PWSTR known = nullptr;
    fs::path base = fs::current_path();
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_LocalAppData, 0, nullptr, &known))) {
        base = fs::path(known);
    }
    CoTaskMemFree(known);
    return base / APP_DIRECTORY;
#elif defined(POLYFOREST_PLATFORM_MACOS)
    return home_directory() / "Library" / "Application Support" / APP_DIRECTORY;
#else
    return env_path("XDG_DATA_HOME").value_or(home_directory() / ".local" / "share") / APP_DIRECTORY;
#endif
}

std::optional<std::string> FileSystem::read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::warn("Cannot open '{}' for reading", path.string());
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        spdlog::warn("Read of '{}' failed part way", path.string());
        return std::nullopt;
    }
    return contents.str();
}

bool FileSystem::write_text(const fs::path& path, std::string_view content) {
    if (path.has_parent_path() && !create_directories(path.parent_path())) {
        return false;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::warn("Cannot open '{}' for writing", path.string());
        return false;
    }

    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        spdlog::warn("Write of '{}' failed", path.string());
        return false;
    }
    return true;
}

bool FileSystem::create_directories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        spdlog::error("Cannot create directory '{}': {}", path.string(), ec.message());
        return false;
    }
    return true;
}

bool FileSystem::exists(const fs::path& path) {
    std::error_code ec;
    const bool found = fs::exists(path, ec);
    if (ec) {
        spdlog::warn("Cannot check '{}': {}", path.string(), ec.message());
        return false;
    }
    return found;
}

}  // namespace polyforest::platform
