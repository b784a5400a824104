#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "error.h"

namespace blobstrip {

/// 40-char lowercase hex SHA-1 of an object's canonical git encoding.
using ObjectId = std::string;

// ---------------------------------------------------------------------------
// Mode constants (mirror git filemode integers)
// ---------------------------------------------------------------------------

constexpr uint32_t MODE_BLOB      = 0100644; ///< Regular file.
constexpr uint32_t MODE_BLOB_EXEC = 0100755; ///< Executable file.
constexpr uint32_t MODE_LINK      = 0120000; ///< Symbolic link.
constexpr uint32_t MODE_TREE      = 0040000; ///< Directory / subtree.
constexpr uint32_t MODE_GITLINK   = 0160000; ///< Submodule commit.

// ---------------------------------------------------------------------------
// Objects
// ---------------------------------------------------------------------------

/// The four git object kinds.
enum class ObjectKind : uint8_t {
    Blob,
    Tree,
    Commit,
    Tag,
};

/// "blob", "tree", "commit" or "tag".
const char* kind_name(ObjectKind kind);

/// Parse a kind name. Returns nullopt for anything else.
std::optional<ObjectKind> kind_from_name(const std::string& name);

/// A raw stored object: kind plus canonical payload (no "<kind> <len>\0"
/// header).
struct Object {
    ObjectKind           kind = ObjectKind::Blob;
    std::vector<uint8_t> data;

    static Object blob(const std::string& text) {
        return Object{ObjectKind::Blob,
                      std::vector<uint8_t>(text.begin(), text.end())};
    }
    static Object blob(std::vector<uint8_t> bytes) {
        return Object{ObjectKind::Blob, std::move(bytes)};
    }
};

/// Kind and payload size, readable without inflating the content.
struct ObjectHeader {
    ObjectKind kind;
    uint64_t   size;
};

/// One named entry in a tree.
struct TreeEntry {
    std::string name; ///< Basename, never contains '/'.
    uint32_t    mode; ///< Raw git filemode.
    ObjectId    id;   ///< Child object.

    bool is_tree() const    { return mode == MODE_TREE; }
    bool is_gitlink() const { return mode == MODE_GITLINK; }
    bool is_blob() const    { return !is_tree() && !is_gitlink(); }

    bool operator==(const TreeEntry& o) const {
        return name == o.name && mode == o.mode && id == o.id;
    }
};

/// A directory listing, entries kept in git order.
struct Tree {
    std::vector<TreeEntry> entries;
};

/// Extra commit/tag header lines ("encoding", "gpgsig", "mergetag", ...),
/// kept verbatim. Multi-line values carry their embedded newlines.
using ExtraHeaders = std::vector<std::pair<std::string, std::string>>;

/// A parsed commit.
struct Commit {
    ObjectId              tree;
    std::vector<ObjectId> parents;
    std::string           author;    ///< Full line after "author ".
    std::string           committer; ///< Full line after "committer ".
    ExtraHeaders          extra_headers;
    std::string           message;   ///< Raw message, may lack trailing newline.

    /// Committer timestamp (POSIX seconds); 0 when the line has none.
    int64_t time() const;
};

/// A parsed annotated tag.
struct Tag {
    ObjectId                   object;
    ObjectKind                 type = ObjectKind::Commit;
    std::string                name;
    std::optional<std::string> tagger;
    ExtraHeaders               extra_headers;
    std::string                message;
};

// ---------------------------------------------------------------------------
// Refs
// ---------------------------------------------------------------------------

/// A direct ref as enumerated from the store.
struct RefEntry {
    std::string name;   ///< Full ref name, e.g. "refs/heads/main".
    ObjectId    target;
};

/// One compare-and-swap operation inside a ref transaction.
struct RefUpdate {
    std::string             name;
    std::optional<ObjectId> expected;     ///< nullopt: ref must not exist.
    std::optional<ObjectId> target;       ///< nullopt: delete the ref.
    bool                    force = false; ///< Skip the expected check.
};

/// Planned or applied movement of a single ref.
struct RefChange {
    std::string ref_name;
    ObjectId    old_target;
    ObjectId    new_target;

    bool moved() const { return old_target != new_target; }
};

// ---------------------------------------------------------------------------
// Locking
// ---------------------------------------------------------------------------

/// How to acquire the exclusive store lock.
enum class LockMode : uint8_t {
    Wait, ///< Retry until the bounded timeout expires.
    Try,  ///< Fail immediately if held.
};

// ---------------------------------------------------------------------------
// Policy
// ---------------------------------------------------------------------------

/// What happens to an offending blob.
enum class StripMode : uint8_t {
    Tombstone, ///< Replace with a small note naming the original.
    Empty,     ///< Replace with a zero-length blob.
    Drop,      ///< Remove the tree entry altogether.
};

const char* strip_mode_name(StripMode mode);
std::optional<StripMode> strip_mode_from_name(const std::string& name);

/// Blob size policy. A blob is offending iff its size exceeds
/// `size_threshold_bytes` and, when `path_patterns` is set, its full path
/// matches one of the patterns.
struct Policy {
    int64_t                                 size_threshold_bytes = 0;
    std::optional<std::vector<std::string>> path_patterns;
    StripMode                               strip_mode = StripMode::Tombstone;

    /// @throws PolicyInvalidError for a non-positive threshold or a
    ///         malformed pattern.
    void validate() const;

    bool has_path_predicate() const {
        return path_patterns.has_value() && !path_patterns->empty();
    }
};

// ---------------------------------------------------------------------------
// Options
// ---------------------------------------------------------------------------

/// Options for HistoryRewriter::rewrite / verify.
struct RewriteOptions {
    bool        dry_run = false;
    unsigned    jobs    = 1;             ///< Worker threads for the walk.
    std::string backup_namespace = "refs/backup/";
    bool        overwrite_backups = false; ///< Replace stale backup refs.
    std::string reflog_message = "blobstrip: rewrite";
    std::chrono::milliseconds lock_timeout{30000};
    const std::atomic<bool>*  cancel = nullptr; ///< Set to abort the walk.
};

/// Options for HistoryRewriter::collect_garbage.
struct GcOptions {
    bool        confirm = false;
    std::string backup_namespace = "refs/backup/";
    bool        expire_reflogs = true;
};

/// Options for opening a GitObjectStore.
struct OpenOptions {
    bool create = false; ///< Initialise a bare repository if missing.
};

// ---------------------------------------------------------------------------
// Reports
// ---------------------------------------------------------------------------

/// A blob the policy strips, with a path it was found at.
struct StrippedBlob {
    ObjectId                id;
    uint64_t                size = 0;
    std::string             path;
    std::optional<ObjectId> replacement; ///< nullopt in Drop mode.
};

/// Outcome of a rewrite or a dry run (same shape for both).
struct RewriteReport {
    ResultCode code    = ResultCode::Success;
    bool       dry_run = false;

    size_t   rewritten_commit_count   = 0;
    size_t   stripped_blob_count      = 0;
    uint64_t bytes_reclaimed_estimate = 0;
    size_t   objects_written          = 0;

    std::vector<ObjectId>     affected_commit_ids; ///< Old ids, topological order.
    std::vector<std::string>  affected_ref_names;
    std::vector<RefChange>    ref_changes;         ///< Moved refs only.
    std::vector<StrippedBlob> stripped_blobs;

    /// Target of a detached HEAD that was left on history this pass
    /// rewrites. HEAD is never moved, so that history survives GC.
    std::optional<ObjectId>   detached_head;

    size_t   offending_blob_count() const  { return stripped_blob_count; }
    uint64_t offending_total_bytes() const { return bytes_reclaimed_estimate; }
};

/// Outcome of a confirmed garbage collection.
struct GcReport {
    std::vector<std::string> expired_refs;
    size_t                   objects_removed = 0;
    uint64_t                 bytes_freed     = 0;
    bool                     journal_cleared = false;

    bool performed_work() const {
        return !expired_refs.empty() || objects_removed > 0 || journal_cleared;
    }
};

/// Outcome of a rollback.
struct RollbackReport {
    std::vector<RefChange> restored; ///< old_target: rewritten tip, new_target: original.
};

} // namespace blobstrip
