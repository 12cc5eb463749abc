#pragma once

/**
 * @file parser.hpp
 * @brief Name string -> SaveName, all or nothing
 *
 * Usage:
 *   auto result = savename::parse("__pin__user4_1.0.28650.dat.bak13");
 *   if (result) {
 *       const SaveName& name = result.value();   // tag "4", backup "13", ...
 *   } else {
 *       std::cerr << result.failure().describe() << '\n';
 *   }
 *
 * A failure means the string is not part of the naming scheme. There is no
 * partial record.
 */

#include "savename/save_name.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace savename {

/// Grammar element that was expected where matching stopped
enum class GrammarElement {
    InternalTagClose,  // "__" opened but never closed
    UserPrefix,        // literal "user"
    Suffix             // [version] ".dat" [".bak" digits] end of input
};

[[nodiscard]] std::string_view grammarElementName(GrammarElement element);

struct ParseFailure {
    GrammarElement expected = GrammarElement::UserPrefix;
    std::string remainder;      // Unconsumed input at the point of failure
    std::size_t position = 0;   // Offset of remainder in the parsed name

    [[nodiscard]] std::string describe() const;

    bool operator==(const ParseFailure&) const = default;
};

// ============================================================================
// ParseResult - either a SaveName or a ParseFailure
// ============================================================================

class ParseResult {
public:
    ParseResult(SaveName name) : result_(std::move(name)) {}
    ParseResult(ParseFailure failure) : result_(std::move(failure)) {}

    [[nodiscard]] bool ok() const { return std::holds_alternative<SaveName>(result_); }
    explicit operator bool() const { return ok(); }

    /// Throws std::bad_variant_access on failure
    [[nodiscard]] const SaveName& value() const { return std::get<SaveName>(result_); }

    /// Throws std::bad_variant_access on success
    [[nodiscard]] const ParseFailure& failure() const { return std::get<ParseFailure>(result_); }

    [[nodiscard]] std::optional<SaveName> toOptional() const;

private:
    std::variant<SaveName, ParseFailure> result_;
};

// ============================================================================
// SaveNameParser
// ============================================================================

struct ParserOptions {
    // Report rejected names at Info level instead of Debug
    bool logFailures = false;
};

class SaveNameParser {
public:
    SaveNameParser() = default;
    explicit SaveNameParser(ParserOptions options) : options_(options) {}

    [[nodiscard]] ParseResult parse(std::string_view name) const;

    [[nodiscard]] const ParserOptions& options() const { return options_; }

private:
    ParseResult fail(std::string_view name, GrammarElement expected,
                     std::string_view remainder) const;

    ParserOptions options_;
};

/// Parse with default options
[[nodiscard]] ParseResult parse(std::string_view name);

}  // namespace savename
