#pragma once

/**
 * @file grammar.hpp
 * @brief Matchers for the save file naming scheme
 *
 * Full grammar, left to right:
 *
 *   [ "__" internal "__" ] "user" tag [ "_" version ] ".dat" [ ".bak" digits ] EOF
 *
 * Every matcher consumes a prefix of its input and reports what is left in
 * Match::rest. Optional elements report Absent (nothing consumed) rather than
 * Failed, so a caller can tell "not there" from "malformed".
 *
 * The user tag has no delimiter of its own. It is scanned one byte at a time
 * and ends at the first position where the remaining input satisfies
 * [version] suffix EOF (see tailMatches). All literals are ASCII, so the scan
 * never stops inside a UTF-8 sequence.
 */

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace savename::grammar {

inline constexpr std::string_view INTERNAL_MARKER = "__";
inline constexpr std::string_view USER_PREFIX = "user";
inline constexpr char VERSION_PREFIX = '_';
inline constexpr char VERSION_SEPARATOR = '.';
inline constexpr std::string_view SUFFIX = ".dat";
inline constexpr std::string_view BACKUP_MARKER = ".bak";

enum class MatchStatus {
    Matched,  // Element present, value and rest are valid
    Absent,   // Optional element not present, rest == input
    Failed    // Required element missing or malformed, rest is where it broke
};

template<typename T>
struct Match {
    MatchStatus status = MatchStatus::Failed;
    T value{};
    std::string_view rest;

    [[nodiscard]] bool matched() const { return status == MatchStatus::Matched; }
    [[nodiscard]] bool absent() const { return status == MatchStatus::Absent; }
    [[nodiscard]] bool failed() const { return status == MatchStatus::Failed; }

    static Match present(T value, std::string_view rest) {
        return Match{MatchStatus::Matched, std::move(value), rest};
    }
    static Match none(std::string_view input) {
        return Match{MatchStatus::Absent, T{}, input};
    }
    static Match failure(std::string_view at) {
        return Match{MatchStatus::Failed, T{}, at};
    }
};

// ============================================================================
// Element matchers
// ============================================================================

/// "__" text "__" where text is the shortest non-empty run before the next "__".
/// Absent without the opening marker; Failed if the closing marker is missing
/// (rest then points just past the opening marker).
[[nodiscard]] Match<std::string_view> matchInternalTag(std::string_view input);

/// "user" followed by a non-empty tag, ending at the first position where
/// tailMatches() succeeds. Failed if "user" is missing (rest == input) or no
/// split position works (rest points at the start of the tag).
[[nodiscard]] Match<std::string_view> matchUserTag(std::string_view input);

/// "_" digits ("." digits)*. Never fails: anything else is Absent.
/// A "." not followed by a digit is left in rest.
[[nodiscard]] Match<std::string_view> matchVersion(std::string_view input);

/// ".bak" digits* EOF. The id may be empty. Never fails.
[[nodiscard]] Match<std::string_view> matchBackup(std::string_view input);

/// ".dat" [backup] EOF. Value is the backup id if there is one.
[[nodiscard]] Match<std::optional<std::string_view>> matchSuffix(std::string_view input);

/// Look-ahead for the user tag: [version] suffix, consuming nothing.
[[nodiscard]] bool tailMatches(std::string_view input);

// ============================================================================
// Character classes
// ============================================================================

[[nodiscard]] constexpr bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

/// Length of the leading run of ASCII digits
[[nodiscard]] constexpr std::size_t digitRun(std::string_view input) {
    std::size_t n = 0;
    while (n < input.size() && isDigit(input[n])) {
        ++n;
    }
    return n;
}

}  // namespace savename::grammar
