// Scribble Core
// config.hpp - JSON-backed configuration

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace scribble::core {

// Two-level (section -> key -> value) configuration persisted as JSON
class Config {
public:
    Config();
    ~Config();

    // Non-copyable but movable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    bool load(const std::filesystem::path& path);
    bool save(const std::filesystem::path& path) const;
    bool save() const;  // Save to loaded path
    bool load_or_create_default(const std::filesystem::path& path);

    // Parse from an in-memory JSON document, keeps the current data on error
    bool load_from_string(std::string_view content);

    [[nodiscard]] std::filesystem::path get_path() const;

    // Typed getters, the default is returned for missing keys and type mismatches
    [[nodiscard]] int get_int(std::string_view section, std::string_view key, int default_value = 0) const;
    [[nodiscard]] double get_double(std::string_view section, std::string_view key,
                                    double default_value = 0.0) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                         std::string_view default_value = "") const;

    void set_int(std::string_view section, std::string_view key, int value);
    void set_double(std::string_view section, std::string_view key, double value);
    void set_bool(std::string_view section, std::string_view key, bool value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;
    [[nodiscard]] bool has_section(std::string_view section) const;

    bool remove(std::string_view section, std::string_view key);

    using ChangeCallback = std::function<void(std::string_view section, std::string_view key)>;
    void set_change_callback(ChangeCallback callback);

    [[nodiscard]] bool is_dirty() const;
    void mark_clean();

    void set_defaults();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    void notify_changed(std::string_view section, std::string_view key);
};

namespace config_section {
    inline constexpr const char* ATLAS = "atlas";
    inline constexpr const char* DEVICE = "device";
    inline constexpr const char* LOGGING = "logging";
    inline constexpr const char* BENCH = "bench";
}  // namespace config_section

namespace config_key {
    // Atlas section
    inline constexpr const char* WIDTH = "width";
    inline constexpr const char* HEIGHT = "height";
    inline constexpr const char* TILE_SIZE = "tile_size";

    // Device section
    inline constexpr const char* MAX_TEXTURE_SIZE = "max_texture_size";
    inline constexpr const char* MAX_ARRAY_LAYERS = "max_array_layers";

    // Logging section
    inline constexpr const char* LEVEL = "level";
    inline constexpr const char* FILE = "file";

    // Bench section
    inline constexpr const char* FRAMES = "frames";
    inline constexpr const char* GLYPHS_PER_FRAME = "glyphs_per_frame";
    inline constexpr const char* GLYPH_SIZE = "glyph_size";
}  // namespace config_key

}  // namespace scribble::core
