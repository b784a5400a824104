#pragma once

/// @file rewriter.h
/// Two-phase history rewrite: derive objects, then swap refs.

#include "object_store.h"
#include "types.h"

namespace blobstrip {

/// Entry point tying the walker, ref updater and collector together.
///
/// @code
///     auto store = blobstrip::GitObjectStore::open("repo.git");
///     blobstrip::HistoryRewriter rewriter(store);
///     blobstrip::Policy policy;
///     policy.size_threshold_bytes = 100 * 1024 * 1024;
///     auto preview = rewriter.verify(policy);
///     auto report  = rewriter.rewrite(policy);
///     // ...inspect, then make it permanent:
///     blobstrip::GcOptions gc;
///     gc.confirm = true;
///     rewriter.collect_garbage(gc);
/// @endcode
class HistoryRewriter {
public:
    explicit HistoryRewriter(ObjectStore& store) : store_(store) {}

    /// Strip offending blobs from every non-backup ref's history and move
    /// the refs. With `opts.dry_run` this is verify().
    ///
    /// @throws PolicyInvalidError before anything is read.
    /// @throws StoreUnavailableError if the store lock cannot be taken.
    /// @throws MissingObjectError, CorruptObjectError, CancelledError
    ///         with no ref changed.
    /// @throws BackupExistsError if an earlier rewrite is unconfirmed.
    /// @throws RefConflictError if a ref moved concurrently; no ref changed.
    RewriteReport rewrite(const Policy& policy, const RewriteOptions& opts = {});

    /// Report what rewrite() would do without storing anything.
    RewriteReport verify(const Policy& policy, const RewriteOptions& opts = {});

    /// Expire backups and reclaim unreachable objects. Requires
    /// `opts.confirm`.
    GcReport collect_garbage(const GcOptions& opts);

    /// Restore the refs of the last unconfirmed rewrite.
    /// @throws NothingToRollBackError if no rewrite is pending.
    RollbackReport rollback(const RewriteOptions& opts = {});

private:
    RewriteReport run(const Policy& policy, const RewriteOptions& opts,
                      bool dry_run);

    ObjectStore& store_;
};

} // namespace blobstrip
