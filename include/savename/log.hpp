#pragma once

/**
 * @file log.hpp
 * @brief Component-prefixed diagnostic output
 *
 * Lines are written as:
 *   [Component] message            (debug/info, stdout)
 *   [Component] WARNING: message   (stderr)
 *   [Component] ERROR: message     (stderr)
 *
 * The threshold is process-wide and atomic, so loggers may be used from
 * any thread without further locking.
 */

#include <optional>
#include <string>
#include <string_view>

namespace savename {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Off
};

/// Parse a level name ("debug", "info", "warning"/"warn", "error", "off").
/// Case-insensitive. Returns nullopt for anything else.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view text);

[[nodiscard]] std::string_view logLevelName(LogLevel level);

class Logger {
public:
    explicit Logger(std::string_view component) : component_(component) {}

    void debug(std::string_view message) const;
    void info(std::string_view message) const;
    void warn(std::string_view message) const;
    void error(std::string_view message) const;

    [[nodiscard]] bool enabled(LogLevel level) const;
    [[nodiscard]] const std::string& component() const { return component_; }

    // Global threshold (default: Warning)
    static void setLevel(LogLevel level);
    [[nodiscard]] static LogLevel level();

private:
    void write(LogLevel level, std::string_view message) const;

    std::string component_;
};

}  // namespace savename
