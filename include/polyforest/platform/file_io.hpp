// PolyForest Platform Layer
// file_io.hpp - Settings and log file locations, whole-file text I/O

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace polyforest::platform {

namespace fs = std::filesystem;

class FileSystem {
public:
    // Per-user writable directory for logs: $XDG_DATA_HOME/PolyForest on Linux,
    // ~/Library/Application Support/PolyForest on macOS, %LOCALAPPDATA%\PolyForest on Windows
    static fs::path get_user_data_directory();

    // Whole file as a string; nullopt (logged) if it cannot be opened or read
    static std::optional<std::string> read_text(const fs::path& path);

    // Replace the file's contents, creating parent directories as needed
    static bool write_text(const fs::path& path, std::string_view content);

    static bool create_directories(const fs::path& path);
    static bool exists(const fs::path& path);

private:
    FileSystem() = delete;
};

}  // namespace polyforest::platform
