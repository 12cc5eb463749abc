#pragma once

/**
 * @file save_name.hpp
 * @brief Decoded save file name and its canonical formatting
 *
 * A SaveName holds the four fields of a name such as
 *
 *   __pin__user4_1.0.28650.dat.bak13
 *     |        |  |              |
 *     |        |  version        backupId
 *     |        tag
 *     internalTag
 *
 * and formats back to exactly that string. Fields are validated when the
 * value is built, so formatting cannot fail.
 *
 * backupId distinguishes three states:
 *   nullopt -> not a backup          (user2.dat)
 *   ""      -> backup without an id  (user2.dat.bak)
 *   "15"    -> numbered backup       (user2.dat.bak15)
 *
 * Tag restriction: a tag whose end looks like a version ("2_1" with no
 * version set) formats fine, but parsing the result splits it differently
 * (tag "2", version "1"). roundTrips() reports whether a given value
 * survives format then parse unchanged.
 */

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace savename {

class SaveName {
public:
    /// Throws std::invalid_argument if any field is ill-formed.
    explicit SaveName(std::string tag,
                      std::optional<std::string> version = std::nullopt,
                      std::optional<std::string> backupId = std::nullopt,
                      std::optional<std::string> internalTag = std::nullopt);

    /// Non-throwing construction. Returns nullopt if any field is ill-formed.
    [[nodiscard]] static std::optional<SaveName> create(
        std::string_view tag,
        std::optional<std::string_view> version = std::nullopt,
        std::optional<std::string_view> backupId = std::nullopt,
        std::optional<std::string_view> internalTag = std::nullopt);

    [[nodiscard]] const std::string& tag() const { return tag_; }
    [[nodiscard]] const std::optional<std::string>& version() const { return version_; }
    [[nodiscard]] const std::optional<std::string>& backupId() const { return backupId_; }
    [[nodiscard]] const std::optional<std::string>& internalTag() const { return internalTag_; }

    [[nodiscard]] bool hasVersion() const { return version_.has_value(); }
    [[nodiscard]] bool isBackup() const { return backupId_.has_value(); }
    [[nodiscard]] bool isInternal() const { return internalTag_.has_value(); }

    /// Number of dot-separated groups in the version (0 if none)
    [[nodiscard]] std::size_t versionComponentCount() const;

    /// Old four-component versions (1.2.3.28891) as opposed to 1.0.28891
    [[nodiscard]] bool isLegacyVersion() const { return versionComponentCount() == 4; }

    /// Canonical file name
    [[nodiscard]] std::string toString() const;

    /// True if parse(toString()) yields this same value
    [[nodiscard]] bool roundTrips() const;

    bool operator==(const SaveName&) const = default;

private:
    std::string tag_;
    std::optional<std::string> version_;
    std::optional<std::string> backupId_;
    std::optional<std::string> internalTag_;
};

[[nodiscard]] std::string format(const SaveName& name);

std::ostream& operator<<(std::ostream& os, const SaveName& name);

// ============================================================================
// Field validation
// ============================================================================

/// One or more non-empty digit groups separated by '.'
[[nodiscard]] bool isValidVersion(std::string_view version);

/// Digits only; the empty string is valid
[[nodiscard]] bool isValidBackupId(std::string_view backupId);

/// Non-empty, and reads back as exactly itself inside "__...__"
[[nodiscard]] bool isValidInternalTag(std::string_view internalTag);

/// Non-empty
[[nodiscard]] bool isValidTag(std::string_view tag);

}  // namespace savename
