#include "savename/log.hpp"

#include <atomic>
#include <cctype>
#include <iostream>

namespace savename {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Warning};

}  // namespace

std::optional<LogLevel> parseLogLevel(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off" || lower == "none") return LogLevel::Off;
    return std::nullopt;
}

std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

void Logger::setLevel(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() {
    return g_level.load(std::memory_order_relaxed);
}

bool Logger::enabled(LogLevel level) const {
    auto threshold = Logger::level();
    return threshold != LogLevel::Off && level >= threshold;
}

void Logger::debug(std::string_view message) const {
    write(LogLevel::Debug, message);
}

void Logger::info(std::string_view message) const {
    write(LogLevel::Info, message);
}

void Logger::warn(std::string_view message) const {
    write(LogLevel::Warning, message);
}

void Logger::error(std::string_view message) const {
    write(LogLevel::Error, message);
}

void Logger::write(LogLevel level, std::string_view message) const {
    if (!enabled(level)) {
        return;
    }

    // Build the whole line first so concurrent writers don't interleave mid-line
    std::string line;
    line.reserve(component_.size() + message.size() + 16);
    line += '[';
    line += component_;
    line += "] ";
    if (level == LogLevel::Warning) {
        line += "WARNING: ";
    } else if (level == LogLevel::Error) {
        line += "ERROR: ";
    }
    line += message;
    line += '\n';

    if (level >= LogLevel::Warning) {
        std::cerr << line;
    } else {
        std::cout << line;
    }
}

}  // namespace savename
