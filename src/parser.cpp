#include "savename/parser.hpp"
#include "savename/grammar.hpp"
#include "savename/log.hpp"

#include <utility>

namespace savename {

namespace {

const Logger& parserLog() {
    static const Logger logger("SaveNameParser");
    return logger;
}

std::optional<std::string> toOwned(std::optional<std::string_view> value) {
    if (!value) {
        return std::nullopt;
    }
    return std::string(*value);
}

}  // namespace

std::string_view grammarElementName(GrammarElement element) {
    switch (element) {
        case GrammarElement::InternalTagClose: return "internal tag closing '__'";
        case GrammarElement::UserPrefix: return "'user'";
        case GrammarElement::Suffix: return "'.dat' suffix";
    }
    return "unknown element";
}

std::string ParseFailure::describe() const {
    std::string out = "expected ";
    out += grammarElementName(expected);
    out += " at offset ";
    out += std::to_string(position);
    out += ", remaining '";
    out += remainder;
    out += "'";
    return out;
}

std::optional<SaveName> ParseResult::toOptional() const {
    if (!ok()) {
        return std::nullopt;
    }
    return value();
}

ParseResult SaveNameParser::parse(std::string_view name) const {
    // 1. Internal tag
    auto internal = grammar::matchInternalTag(name);
    if (internal.failed()) {
        return fail(name, GrammarElement::InternalTagClose, internal.rest);
    }

    // 2. User tag, bounded by the look-ahead
    auto user = grammar::matchUserTag(internal.rest);
    if (user.failed()) {
        // rest is left untouched only when "user" itself is missing
        auto expected = user.rest.size() == internal.rest.size()
            ? GrammarElement::UserPrefix
            : GrammarElement::Suffix;
        return fail(name, expected, user.rest);
    }

    // 3. Version
    auto version = grammar::matchVersion(user.rest);

    // 4. Suffix, backup id, end of input
    auto suffix = grammar::matchSuffix(version.rest);
    if (suffix.failed()) {
        return fail(name, GrammarElement::Suffix, suffix.rest);
    }

    std::optional<std::string_view> internalTag;
    if (internal.matched()) {
        internalTag = internal.value;
    }
    std::optional<std::string_view> versionTag;
    if (version.matched()) {
        versionTag = version.value;
    }

    return SaveName(std::string(user.value), toOwned(versionTag),
                    toOwned(suffix.value), toOwned(internalTag));
}

ParseResult SaveNameParser::fail(std::string_view name, GrammarElement expected,
                                 std::string_view remainder) const {
    ParseFailure failure;
    failure.expected = expected;
    failure.remainder = std::string(remainder);
    failure.position = name.size() - remainder.size();

    const auto& logger = parserLog();
    auto level = options_.logFailures ? LogLevel::Info : LogLevel::Debug;
    if (logger.enabled(level)) {
        std::string message = "Rejected '";
        message += name;
        message += "': ";
        message += failure.describe();
        if (level == LogLevel::Info) {
            logger.info(message);
        } else {
            logger.debug(message);
        }
    }

    return failure;
}

ParseResult parse(std::string_view name) {
    static const SaveNameParser parser{};
    return parser.parse(name);
}

}  // namespace savename
