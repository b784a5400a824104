#include "blobstrip/rewriter.h"
#include "blobstrip/filter.h"
#include "blobstrip/gc.h"
#include "blobstrip/json.h"
#include "blobstrip/log.h"
#include "blobstrip/ref_updater.h"
#include "blobstrip/translation_table.h"
#include "blobstrip/walker.h"

#include <algorithm>
#include <memory>

namespace blobstrip {

RewriteReport HistoryRewriter::rewrite(const Policy& policy, const RewriteOptions& opts) {
    return run(policy, opts, opts.dry_run);
}

RewriteReport HistoryRewriter::verify(const Policy& policy, const RewriteOptions& opts) {
    return run(policy, opts, true);
}

RewriteReport HistoryRewriter::run(const Policy& policy, const RewriteOptions& opts,
                                   bool dry_run) {
    FilterEngine filter(policy);

    // A dry run never writes, so it does not need the writer lock
    std::unique_ptr<StoreLock> guard;
    if (!dry_run) guard = store_.lock(LockMode::Wait, opts.lock_timeout);

    auto updater = RefUpdater::for_pending(store_, opts.backup_namespace);
    std::vector<RefEntry> refs = updater.primary_refs();
    std::vector<ObjectId> tips;
    tips.reserve(refs.size());
    for (auto& r : refs) tips.push_back(r.target);

    TranslationTable table;
    std::unique_ptr<ObjectSink> sink;
    if (dry_run) {
        sink = std::make_unique<HashSink>(store_);
    } else {
        sink = std::make_unique<StoreSink>(store_);
    }

    GraphWalker walker(store_, filter, table, *sink);
    walker.set_jobs(opts.jobs);
    walker.set_cancel(opts.cancel);
    WalkResult walk = walker.run(tips);

    std::vector<RefChange> plan = updater.plan(refs, table);

    RewriteReport report;
    report.dry_run                  = dry_run;
    report.rewritten_commit_count   = walk.rewritten_commits.size();
    report.stripped_blob_count      = walk.stripped_blobs.size();
    report.bytes_reclaimed_estimate = walk.stripped_bytes;
    report.objects_written          = sink->objects_written();
    report.affected_commit_ids      = std::move(walk.rewritten_commits);
    report.stripped_blobs           = std::move(walk.stripped_blobs);
    // HEAD on a branch resolves to that branch's tip; otherwise it is detached
    if (auto head = store_.read_ref("HEAD")) {
        bool on_ref = std::any_of(refs.begin(), refs.end(),
                                  [&](const RefEntry& r) { return r.target == *head; });
        auto moved = table.lookup(*head);
        if (!on_ref && moved && *moved != *head) {
            BLOBSTRIP_LOG_WARN("HEAD is detached at {} and is not rewritten; "
                               "its history keeps the stripped blobs", *head);
            report.detached_head = *head;
        }
    }
    for (auto& c : plan) {
        if (!c.moved()) continue;
        report.affected_ref_names.push_back(c.ref_name);
        report.ref_changes.push_back(c);
    }

    if (dry_run) {
        report.code = ResultCode::SuccessDryRun;
        return report;
    }

    // Last point at which cancelling is allowed
    if (opts.cancel && opts.cancel->load()) throw CancelledError();

    if (!report.ref_changes.empty()) {
        if (!opts.overwrite_backups) updater.check_backups(plan);

        // Merge with a pending journal; refs moved again take the new change
        auto previous = store_.read_journal();
        RewriteJournal journal;
        journal.backup_namespace = updater.backup_namespace();
        if (previous) {
            for (auto& c : decode_journal(*previous).changes) {
                bool superseded = std::any_of(
                    report.ref_changes.begin(), report.ref_changes.end(),
                    [&](const RefChange& n) { return n.ref_name == c.ref_name; });
                if (!superseded) journal.changes.push_back(c);
            }
        }
        journal.changes.insert(journal.changes.end(), report.ref_changes.begin(),
                               report.ref_changes.end());
        store_.write_journal(encode_journal(journal));

        try {
            updater.apply(plan, opts.overwrite_backups, opts.reflog_message);
        } catch (...) {
            // No ref moved, so the journal must not describe this pass
            if (previous) {
                store_.write_journal(*previous);
            } else {
                store_.clear_journal();
            }
            throw;
        }
    }

    report.code = ResultCode::Success;
    BLOBSTRIP_LOG_INFO("rewrite: {} commits rewritten, {} blobs stripped, {} refs moved",
                       report.rewritten_commit_count, report.stripped_blob_count,
                       report.ref_changes.size());
    return report;
}

GcReport HistoryRewriter::collect_garbage(const GcOptions& opts) {
    return GarbageCollector(store_).run(opts);
}

RollbackReport HistoryRewriter::rollback(const RewriteOptions& opts) {
    auto guard = store_.lock(LockMode::Wait, opts.lock_timeout);

    auto text = store_.read_journal();
    if (!text) throw NothingToRollBackError();

    RewriteJournal journal = decode_journal(*text);
    RefUpdater updater(store_, journal.backup_namespace);
    RollbackReport report = updater.rollback(journal.changes, "blobstrip: rollback");
    store_.clear_journal();

    BLOBSTRIP_LOG_INFO("rollback: {} refs restored", report.restored.size());
    return report;
}

} // namespace blobstrip
