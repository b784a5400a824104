#pragma once

/// @file json.h
/// JSON forms of policies, reports and the rewrite journal.

#include "types.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace blobstrip {

// nlohmann ADL hooks

void to_json(nlohmann::json& j, const RefChange& c);
void from_json(const nlohmann::json& j, RefChange& c);
void to_json(nlohmann::json& j, const StrippedBlob& b);
void to_json(nlohmann::json& j, const RewriteReport& r);
void to_json(nlohmann::json& j, const GcReport& r);
void to_json(nlohmann::json& j, const RollbackReport& r);
void to_json(nlohmann::json& j, const Policy& p);

/// Parse a policy document:
/// @code
///     {"size_threshold_bytes": 104857600,
///      "path_patterns": ["*.bin", "assets/**"],
///      "strip_mode": "tombstone"}
/// @endcode
/// `size_threshold_bytes` may also be a string with a K/M/G suffix.
/// The result is validated.
/// @throws PolicyInvalidError on a malformed document.
Policy policy_from_json(const nlohmann::json& j);

/// Parse "150", "100K", "100M", "2G" (binary multiples).
/// @throws PolicyInvalidError if `text` is not a size.
int64_t parse_size(const std::string& text);

// ---------------------------------------------------------------------------
// Journal
// ---------------------------------------------------------------------------

/// Undo log of one applied rewrite.
struct RewriteJournal {
    std::string            backup_namespace;
    std::vector<RefChange> changes; ///< Moved refs only.
};

std::string     encode_journal(const RewriteJournal& journal);

/// @throws BlobstripError if `text` is not a journal.
RewriteJournal  decode_journal(const std::string& text);

} // namespace blobstrip
