#pragma once

/// @file ref_updater.h
/// Atomic remapping of refs after a rewrite.

#include "object_store.h"
#include "translation_table.h"
#include "types.h"

#include <string>
#include <vector>

namespace blobstrip {

/// Moves refs from their old tips to translated tips in a single
/// compare-and-swap transaction, keeping every moved tip under a backup
/// ref until garbage collection.
class RefUpdater {
public:
    explicit RefUpdater(ObjectStore& store,
                        std::string backup_namespace = "refs/backup/");

    /// Updater for the namespace a pending rewrite recorded in the
    /// journal, or for `requested` when nothing is pending.
    /// @throws BlobstripError if the journal cannot be decoded.
    static RefUpdater for_pending(ObjectStore& store, const std::string& requested);

    /// Backup ref for `ref_name`: "refs/heads/main" becomes
    /// "<namespace>heads/main".
    std::string backup_name(const std::string& ref_name) const;

    /// True if `ref_name` lives in the backup namespace.
    bool is_backup(const std::string& ref_name) const;

    /// Refs outside the backup namespace.
    std::vector<RefEntry> primary_refs();

    /// One RefChange per ref (unmoved refs included, as identity).
    std::vector<RefChange> plan(const std::vector<RefEntry>& refs,
                                const TranslationTable& table) const;

    /// @throws BackupExistsError if a moved ref already has a backup.
    void check_backups(const std::vector<RefChange>& plan);

    /// Apply `plan` as one transaction: unmoved refs are verified, moved
    /// refs are swapped and backed up.
    /// @return The moved refs.
    /// @throws RefConflictError naming the ref that changed; nothing is
    ///         written in that case.
    std::vector<RefChange> apply(const std::vector<RefChange>& plan,
                                 bool overwrite_backups,
                                 const std::string& message);

    /// Undo `applied`: each ref goes back from new_target to old_target
    /// and its backup is deleted, in one transaction.
    /// @throws RefConflictError if any ref or backup moved since.
    RollbackReport rollback(const std::vector<RefChange>& applied,
                            const std::string& message);

    const std::string& backup_namespace() const { return namespace_; }

private:
    ObjectStore& store_;
    std::string  namespace_;
};

} // namespace blobstrip
