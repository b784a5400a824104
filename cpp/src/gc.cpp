#include "blobstrip/gc.h"
#include "blobstrip/log.h"
#include "blobstrip/object.h"
#include "blobstrip/ref_updater.h"

namespace blobstrip {

std::unordered_set<ObjectId> GarbageCollector::mark(const std::vector<ObjectId>& roots) {
    std::unordered_set<ObjectId> reachable;
    std::vector<ObjectId> stack(roots.begin(), roots.end());

    while (!stack.empty()) {
        ObjectId id = std::move(stack.back());
        stack.pop_back();
        if (!reachable.insert(id).second) continue;

        ObjectKind kind = store_.stat(id).kind;
        switch (kind) {
            case ObjectKind::Blob:
                break;
            case ObjectKind::Tree:
                for (auto& e : decode_tree(store_.get(id), id).entries) {
                    if (!e.is_gitlink()) stack.push_back(e.id);
                }
                break;
            case ObjectKind::Commit: {
                Commit c = decode_commit(store_.get(id), id);
                stack.push_back(c.tree);
                for (auto& p : c.parents) stack.push_back(p);
                break;
            }
            case ObjectKind::Tag:
                stack.push_back(decode_tag(store_.get(id), id).object);
                break;
        }
    }
    return reachable;
}

GcReport GarbageCollector::run(const GcOptions& opts) {
    if (!opts.confirm) {
        throw GcPreconditionError("confirmation required");
    }

    std::unique_ptr<StoreLock> guard;
    try {
        guard = store_.lock(LockMode::Try, std::chrono::milliseconds(0));
    } catch (const StoreUnavailableError& e) {
        throw GcPreconditionError(std::string("a rewrite is in progress (") + e.what() + ")");
    }

    auto updater = RefUpdater::for_pending(store_, opts.backup_namespace);
    std::vector<RefEntry> backups;
    std::vector<ObjectId> roots;
    for (auto& r : store_.iterate_refs()) {
        if (updater.is_backup(r.name)) {
            backups.push_back(r);
        } else {
            roots.push_back(r.target);
        }
    }
    // A detached HEAD is not among the refs but must survive the sweep
    if (auto head = store_.read_ref("HEAD")) roots.push_back(*head);

    // Mark before touching anything, so a broken graph aborts cleanly
    auto reachable = mark(roots);

    GcReport report;
    if (!backups.empty()) {
        std::vector<RefUpdate> deletes;
        for (auto& b : backups) {
            deletes.push_back(RefUpdate{b.name, b.target, std::nullopt, false});
            report.expired_refs.push_back(b.name);
        }
        store_.apply_ref_transaction(deletes, "blobstrip: gc");
    }

    report.journal_cleared = store_.clear_journal();

    if (opts.expire_reflogs) {
        size_t n = store_.expire_reflogs();
        if (n > 0) BLOBSTRIP_LOG_DEBUG("expired {} reflogs", n);
    }

    std::vector<ObjectId> doomed;
    for (auto& id : store_.list_objects()) {
        if (reachable.count(id)) continue;
        report.bytes_freed += store_.stat(id).size;
        doomed.push_back(id);
    }
    store_.remove_objects(doomed);
    report.objects_removed = doomed.size();

    BLOBSTRIP_LOG_INFO("gc: {} backup refs expired, {} objects removed ({} bytes)",
                       report.expired_refs.size(), report.objects_removed,
                       report.bytes_freed);
    return report;
}

} // namespace blobstrip
