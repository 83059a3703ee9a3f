// Scribble Core
// logger.hpp - Category-based logging over spdlog

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace scribble::core {

// Log levels matching spdlog for easy conversion
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// "trace", "debug", "info", "warn", "error", "critical", "off"
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    bool file_output = true;
    std::filesystem::path log_directory;  // Empty = <user data dir>/logs
    std::string log_filename = "scribble.log";
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;
    bool include_timestamps = true;
};

// Static logging interface
class Logger {
public:
    // Initialize/shutdown (call once at startup/exit)
    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

    // Per-category level, falls back to the global level
    static void set_category_level(std::string_view category, LogLevel level);
    [[nodiscard]] static LogLevel get_category_level(std::string_view category);

    static void set_global_level(LogLevel level);
    [[nodiscard]] static LogLevel get_global_level();

    static void flush();

    template<typename... Args>
    static void trace(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Trace, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Debug, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Info, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Warn, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Error, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Critical, category, fmt, std::forward<Args>(args)...);
    }

private:
    Logger() = delete;

    template<typename... Args>
    static void log_impl(LogLevel level, std::string_view category, fmt::format_string<Args...> fmt,
                         Args&&... args) {
        if (!should_log(level, category)) {
            return;
        }
        auto message = fmt::format(fmt, std::forward<Args>(args)...);
        log_message(level, category, message);
    }

    [[nodiscard]] static bool should_log(LogLevel level, std::string_view category);
    static void log_message(LogLevel level, std::string_view category, std::string_view message);
};

namespace log_category {
    inline constexpr const char* ENGINE = "engine";
    inline constexpr const char* GRAPHICS = "graphics";
    inline constexpr const char* ATLAS = "atlas";
    inline constexpr const char* CACHE = "cache";
    inline constexpr const char* CONFIG = "config";
}  // namespace log_category

}  // namespace scribble::core

#define SCRIBBLE_LOG_TRACE(category, ...) \
    ::scribble::core::Logger::trace(category, __VA_ARGS__)

#define SCRIBBLE_LOG_DEBUG(category, ...) \
    ::scribble::core::Logger::debug(category, __VA_ARGS__)

#define SCRIBBLE_LOG_INFO(category, ...) \
    ::scribble::core::Logger::info(category, __VA_ARGS__)

#define SCRIBBLE_LOG_WARN(category, ...) \
    ::scribble::core::Logger::warn(category, __VA_ARGS__)

#define SCRIBBLE_LOG_ERROR(category, ...) \
    ::scribble::core::Logger::error(category, __VA_ARGS__)

#define SCRIBBLE_LOG_CRITICAL(category, ...) \
    ::scribble::core::Logger::critical(category, __VA_ARGS__)
