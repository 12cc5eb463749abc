#include "savename/save_name.hpp"
#include "savename/grammar.hpp"
#include "savename/parser.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace savename {

namespace {

template<typename T>
std::optional<std::string> toOwned(const std::optional<T>& value) {
    if (!value) {
        return std::nullopt;
    }
    return std::string(*value);
}

// Returns the name of the first bad field, or nullptr if all are well-formed
const char* firstInvalidField(std::string_view tag,
                              const std::optional<std::string>& version,
                              const std::optional<std::string>& backupId,
                              const std::optional<std::string>& internalTag) {
    if (!isValidTag(tag)) return "tag";
    if (version && !isValidVersion(*version)) return "version";
    if (backupId && !isValidBackupId(*backupId)) return "backup id";
    if (internalTag && !isValidInternalTag(*internalTag)) return "internal tag";
    return nullptr;
}

}  // namespace

SaveName::SaveName(std::string tag,
                   std::optional<std::string> version,
                   std::optional<std::string> backupId,
                   std::optional<std::string> internalTag)
    : tag_(std::move(tag))
    , version_(std::move(version))
    , backupId_(std::move(backupId))
    , internalTag_(std::move(internalTag))
{
    if (const char* field = firstInvalidField(tag_, version_, backupId_, internalTag_)) {
        throw std::invalid_argument(std::string("SaveName: ill-formed ") + field);
    }
}

std::optional<SaveName> SaveName::create(std::string_view tag,
                                         std::optional<std::string_view> version,
                                         std::optional<std::string_view> backupId,
                                         std::optional<std::string_view> internalTag) {
    auto ownedVersion = toOwned(version);
    auto ownedBackup = toOwned(backupId);
    auto ownedInternal = toOwned(internalTag);

    if (firstInvalidField(tag, ownedVersion, ownedBackup, ownedInternal)) {
        return std::nullopt;
    }

    return SaveName(std::string(tag), std::move(ownedVersion),
                    std::move(ownedBackup), std::move(ownedInternal));
}

std::size_t SaveName::versionComponentCount() const {
    if (!version_) {
        return 0;
    }
    return static_cast<std::size_t>(
        std::count(version_->begin(), version_->end(), grammar::VERSION_SEPARATOR)) + 1;
}

std::string SaveName::toString() const {
    std::string out;
    out.reserve(tag_.size() + 32);

    if (internalTag_) {
        out += grammar::INTERNAL_MARKER;
        out += *internalTag_;
        out += grammar::INTERNAL_MARKER;
    }

    out += grammar::USER_PREFIX;
    out += tag_;

    if (version_) {
        out += grammar::VERSION_PREFIX;
        out += *version_;
    }

    out += grammar::SUFFIX;

    // An empty id still marks a backup
    if (backupId_) {
        out += grammar::BACKUP_MARKER;
        out += *backupId_;
    }

    return out;
}

bool SaveName::roundTrips() const {
    auto result = parse(toString());
    return result.ok() && result.value() == *this;
}

std::string format(const SaveName& name) {
    return name.toString();
}

std::ostream& operator<<(std::ostream& os, const SaveName& name) {
    return os << name.toString();
}

// ============================================================================
// Field validation
// ============================================================================

bool isValidVersion(std::string_view version) {
    if (version.empty()) {
        return false;
    }
    std::string prefixed(1, grammar::VERSION_PREFIX);
    prefixed += version;
    auto match = grammar::matchVersion(prefixed);
    return match.matched() && match.rest.empty();
}

bool isValidBackupId(std::string_view backupId) {
    return grammar::digitRun(backupId) == backupId.size();
}

bool isValidInternalTag(std::string_view internalTag) {
    if (internalTag.empty()) {
        return false;
    }
    std::string wrapped(grammar::INTERNAL_MARKER);
    wrapped += internalTag;
    wrapped += grammar::INTERNAL_MARKER;
    auto match = grammar::matchInternalTag(wrapped);
    return match.matched() && match.value == internalTag && match.rest.empty();
}

bool isValidTag(std::string_view tag) {
    return !tag.empty();
}

}  // namespace savename
