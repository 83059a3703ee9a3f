// Scribble Core
// file_io.hpp - File helpers for logs and configuration

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace scribble::core {

namespace fs = std::filesystem;

// Static helpers around std::filesystem that log instead of throwing
class FileSystem {
public:
    // $XDG_DATA_HOME/scribble or ~/.local/share/scribble (Linux),
    // ~/Library/Application Support/Scribble (macOS)
    static fs::path get_user_data_directory();

    // $XDG_CONFIG_HOME/scribble or ~/.config/scribble (Linux)
    static fs::path get_user_config_directory();

    static fs::path get_temp_directory();

    static std::optional<std::string> read_text(const fs::path& path);
    static bool write_text(const fs::path& path, std::string_view content);

    static bool create_directories(const fs::path& path);
    static bool exists(const fs::path& path);
    static bool remove_all(const fs::path& path);

private:
    FileSystem() = delete;
};

}  // namespace scribble::core
