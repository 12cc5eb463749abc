#pragma once

/**
 * @file settings.hpp
 * @brief Settings file for the parser and its diagnostics
 *
 * Format (one key per line, later lines override earlier ones):
 * ```
 * # Comments start with #
 * log.level: debug
 * parse.log_failures: yes
 * ```
 *
 * Unknown keys and unreadable values are reported through the
 * "Settings" logger and otherwise ignored.
 */

#include "savename/log.hpp"
#include "savename/parser.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace savename {

struct Settings {
    ParserOptions parser;
    std::optional<LogLevel> logLevel;  // nullopt leaves the current level alone
};

/// Parse settings text. Never fails; bad lines are skipped with a warning.
[[nodiscard]] Settings parseSettings(std::string_view content);

/// Read and parse a settings file. Returns nullopt if it cannot be opened.
[[nodiscard]] std::optional<Settings> loadSettings(const std::filesystem::path& path);

/// Push the log level (if set) into Logger
void applySettings(const Settings& settings);

/// Boolean spellings accepted in settings files
[[nodiscard]] std::optional<bool> parseBool(std::string_view text);

}  // namespace savename
