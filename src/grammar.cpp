#include "savename/grammar.hpp"

namespace savename::grammar {

namespace {

bool consumeLiteral(std::string_view& input, std::string_view literal) {
    if (input.substr(0, literal.size()) != literal) {
        return false;
    }
    input.remove_prefix(literal.size());
    return true;
}

}  // namespace

Match<std::string_view> matchInternalTag(std::string_view input) {
    auto rest = input;
    if (!consumeLiteral(rest, INTERNAL_MARKER)) {
        return Match<std::string_view>::none(input);
    }

    // Search from 1 so the tag is never empty
    auto close = rest.find(INTERNAL_MARKER, 1);
    if (close == std::string_view::npos) {
        return Match<std::string_view>::failure(rest);
    }

    auto text = rest.substr(0, close);
    rest.remove_prefix(close + INTERNAL_MARKER.size());
    return Match<std::string_view>::present(text, rest);
}

Match<std::string_view> matchUserTag(std::string_view input) {
    auto rest = input;
    if (!consumeLiteral(rest, USER_PREFIX)) {
        return Match<std::string_view>::failure(input);
    }

    // Take one byte at a time until the tail grammar holds at the split point.
    // The first split from the left wins; no longer or shorter tag is tried.
    for (std::size_t split = 1; split <= rest.size(); ++split) {
        if (tailMatches(rest.substr(split))) {
            return Match<std::string_view>::present(rest.substr(0, split), rest.substr(split));
        }
    }

    return Match<std::string_view>::failure(rest);
}

Match<std::string_view> matchVersion(std::string_view input) {
    if (input.empty() || input[0] != VERSION_PREFIX) {
        return Match<std::string_view>::none(input);
    }

    auto body = input.substr(1);
    std::size_t len = digitRun(body);
    if (len == 0) {
        return Match<std::string_view>::none(input);
    }

    // Extend group by group; a separator only counts if digits follow it
    while (len < body.size() && body[len] == VERSION_SEPARATOR) {
        std::size_t group = digitRun(body.substr(len + 1));
        if (group == 0) {
            break;
        }
        len += 1 + group;
    }

    return Match<std::string_view>::present(body.substr(0, len), body.substr(len));
}

Match<std::string_view> matchBackup(std::string_view input) {
    auto rest = input;
    if (!consumeLiteral(rest, BACKUP_MARKER)) {
        return Match<std::string_view>::none(input);
    }

    std::size_t len = digitRun(rest);
    if (len != rest.size()) {
        return Match<std::string_view>::none(input);
    }

    return Match<std::string_view>::present(rest, rest.substr(len));
}

Match<std::optional<std::string_view>> matchSuffix(std::string_view input) {
    using Result = Match<std::optional<std::string_view>>;

    auto rest = input;
    if (!consumeLiteral(rest, SUFFIX)) {
        return Result::failure(input);
    }

    std::optional<std::string_view> backupId;
    auto backup = matchBackup(rest);
    if (backup.matched()) {
        backupId = backup.value;
        rest = backup.rest;
    }

    if (!rest.empty()) {
        return Result::failure(rest);
    }

    return Result::present(backupId, rest);
}

bool tailMatches(std::string_view input) {
    auto version = matchVersion(input);
    return matchSuffix(version.rest).matched();
}

}  // namespace savename::grammar
