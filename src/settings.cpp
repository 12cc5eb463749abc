#include "savename/settings.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <string>

namespace savename {

namespace {

const Logger& settingsLog() {
    static const Logger logger("Settings");
    return logger;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

void warnLine(size_t lineNum, std::string_view what, std::string_view text) {
    std::string message = "Line ";
    message += std::to_string(lineNum);
    message += ": ";
    message += what;
    message += ": ";
    message += text;
    settingsLog().warn(message);
}

void applyEntry(Settings& settings, std::string_view key, std::string_view value,
                size_t lineNum) {
    if (key == "log.level") {
        if (auto level = parseLogLevel(value)) {
            settings.logLevel = *level;
        } else {
            warnLine(lineNum, "bad log level", value);
        }
    } else if (key == "parse.log_failures") {
        if (auto flag = parseBool(value)) {
            settings.parser.logFailures = *flag;
        } else {
            warnLine(lineNum, "bad boolean", value);
        }
    } else {
        warnLine(lineNum, "unknown key", key);
    }
}

}  // namespace

std::optional<bool> parseBool(std::string_view text) {
    if (text == "true" || text == "yes" || text == "1" ||
        text == "on" || text == "t" || text == "y") {
        return true;
    }
    if (text == "false" || text == "no" || text == "0" ||
        text == "off" || text == "f" || text == "n") {
        return false;
    }
    return std::nullopt;
}

Settings parseSettings(std::string_view content) {
    Settings settings;
    std::string_view remaining = content;
    size_t lineNum = 0;

    while (!remaining.empty()) {
        auto lineEnd = remaining.find('\n');
        std::string_view line;
        if (lineEnd == std::string_view::npos) {
            line = remaining;
            remaining = {};
        } else {
            line = remaining.substr(0, lineEnd);
            remaining = remaining.substr(lineEnd + 1);
        }
        ++lineNum;

        // Windows line endings
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        auto colonPos = line.find(':');
        if (colonPos == std::string_view::npos) {
            warnLine(lineNum, "missing ':'", line);
            continue;
        }

        auto key = trim(line.substr(0, colonPos));
        auto value = trim(line.substr(colonPos + 1));
        applyEntry(settings, key, value, lineNum);
    }

    return settings;
}

std::optional<Settings> loadSettings(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseSettings(buffer.str());
}

void applySettings(const Settings& settings) {
    if (settings.logLevel) {
        Logger::setLevel(*settings.logLevel);
    }
}

}  // namespace savename
