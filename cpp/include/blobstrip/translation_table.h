#pragma once

#include "types.h"

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace blobstrip {

/// Append-only old-id -> new-id map for one rewrite pass.
///
/// Concurrent readers, one writer at a time. The first translation
/// recorded for an id is authoritative: later record() calls for the same
/// id return it and leave the table unchanged.
class TranslationTable {
public:
    TranslationTable() = default;
    TranslationTable(const TranslationTable&) = delete;
    TranslationTable& operator=(const TranslationTable&) = delete;

    /// Record `old_id -> new_id` unless `old_id` is already mapped.
    /// @return The authoritative translation of `old_id`.
    ObjectId record(const ObjectId& old_id, const ObjectId& new_id);

    std::optional<ObjectId> lookup(const ObjectId& old_id) const;

    /// Translation of `old_id`.
    /// @throws BlobstripError if `old_id` has not been recorded.
    ObjectId at(const ObjectId& old_id) const;

    /// Translation of `old_id`, or `old_id` itself if never recorded.
    ObjectId translate(const ObjectId& old_id) const;

    bool   contains(const ObjectId& old_id) const;
    size_t size() const;

    /// Number of entries whose id changed.
    size_t changed_count() const;

    /// Sorted copy of all entries.
    std::map<ObjectId, ObjectId> snapshot() const;

private:
    mutable std::shared_mutex                 mutex_;
    std::unordered_map<ObjectId, ObjectId>    map_;
    size_t                                    changed_ = 0;
};

} // namespace blobstrip
