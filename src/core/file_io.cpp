// Scribble Core
// file_io.cpp - File helper implementation

#include <scribble/core/file_io.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iterator>

#if defined(__unix__) || defined(__APPLE__)
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace scribble::core {

namespace {

fs::path home_directory() {
    const char* home = std::getenv("HOME");
#if defined(__unix__) || defined(__APPLE__)
    if (home == nullptr) {
        struct passwd* pw = getpwuid(getuid());
        if (pw != nullptr) {
            home = pw->pw_dir;
        }
    }
#endif
    if (home == nullptr) {
        return fs::current_path();
    }
    return fs::path(home);
}

}  // namespace

fs::path FileSystem::get_user_data_directory() {
#if defined(__APPLE__)
    return home_directory() / "Library" / "Application Support" / "Scribble";
#else
    const char* xdg_data = std::getenv("XDG_DATA_HOME");
    if (xdg_data != nullptr && *xdg_data != '\0') {
        return fs::path(xdg_data) / "scribble";
    }
    return home_directory() / ".local" / "share" / "scribble";
#endif
}

fs::path FileSystem::get_user_config_directory() {
#if defined(__APPLE__)
    return get_user_data_directory();
#else
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config != nullptr && *xdg_config != '\0') {
        return fs::path(xdg_config) / "scribble";
    }
    return home_directory() / ".config" / "scribble";
#endif
}

fs::path FileSystem::get_temp_directory() {
    return fs::temp_directory_path() / "scribble";
}

std::optional<std::string> FileSystem::read_text(const fs::path& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for reading: {}", path.string());
            return std::nullopt;
        }

        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        if (!file && !file.eof()) {
            spdlog::warn("Error reading file: {}", path.string());
            return std::nullopt;
        }

        return content;
    } catch (const std::exception& e) {
        spdlog::error("Exception reading file '{}': {}", path.string(), e.what());
        return std::nullopt;
    }
}

bool FileSystem::write_text(const fs::path& path, std::string_view content) {
    try {
        if (path.has_parent_path() && !exists(path.parent_path())) {
            create_directories(path.parent_path());
        }

        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for writing: {}", path.string());
            return false;
        }

        file << content;

        if (!file) {
            spdlog::warn("Error writing file: {}", path.string());
            return false;
        }

        return true;
    } catch (const std::exception& e) {
        spdlog::error("Exception writing file '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::create_directories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        spdlog::error("Failed to create directories '{}': {}", path.string(), ec.message());
        return false;
    }
    return true;
}

bool FileSystem::exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool FileSystem::remove_all(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        spdlog::warn("Failed to remove '{}': {}", path.string(), ec.message());
        return false;
    }
    return true;
}

}  // namespace scribble::core
