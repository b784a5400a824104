#include "blobstrip/ref_updater.h"
#include "blobstrip/json.h"
#include "blobstrip/log.h"

namespace blobstrip {

RefUpdater::RefUpdater(ObjectStore& store, std::string backup_namespace)
    : store_(store), namespace_(std::move(backup_namespace)) {
    if (namespace_.empty()) namespace_ = "refs/backup/";
    if (namespace_.back() != '/') namespace_ += '/';
}

RefUpdater RefUpdater::for_pending(ObjectStore& store, const std::string& requested) {
    RefUpdater updater(store, requested);
    auto text = store.read_journal();
    if (!text) return updater;

    RefUpdater pending(store, decode_journal(*text).backup_namespace);
    if (pending.backup_namespace() != updater.backup_namespace()) {
        BLOBSTRIP_LOG_WARN("pending rewrite keeps backups under {}, ignoring {}",
                           pending.backup_namespace(), updater.backup_namespace());
    }
    return pending;
}

std::string RefUpdater::backup_name(const std::string& ref_name) const {
    const std::string prefix = "refs/";
    if (ref_name.compare(0, prefix.size(), prefix) == 0) {
        return namespace_ + ref_name.substr(prefix.size());
    }
    return namespace_ + ref_name;
}

bool RefUpdater::is_backup(const std::string& ref_name) const {
    return ref_name.compare(0, namespace_.size(), namespace_) == 0;
}

std::vector<RefEntry> RefUpdater::primary_refs() {
    std::vector<RefEntry> out;
    for (auto& r : store_.iterate_refs()) {
        if (!is_backup(r.name)) out.push_back(std::move(r));
    }
    return out;
}

std::vector<RefChange> RefUpdater::plan(const std::vector<RefEntry>& refs,
                                        const TranslationTable& table) const {
    std::vector<RefChange> out;
    out.reserve(refs.size());
    for (auto& r : refs) {
        out.push_back(RefChange{r.name, r.target, table.translate(r.target)});
    }
    return out;
}

void RefUpdater::check_backups(const std::vector<RefChange>& plan) {
    for (auto& c : plan) {
        if (!c.moved()) continue;
        auto backup = backup_name(c.ref_name);
        if (store_.read_ref(backup)) throw BackupExistsError(backup);
    }
}

std::vector<RefChange> RefUpdater::apply(const std::vector<RefChange>& plan,
                                         bool overwrite_backups,
                                         const std::string& message) {
    std::vector<RefChange> moved;
    for (auto& c : plan) {
        if (c.moved()) moved.push_back(c);
    }
    if (moved.empty()) return moved;

    std::vector<RefUpdate> updates;
    updates.reserve(plan.size() + moved.size());
    for (auto& c : plan) {
        // Unmoved refs are verified only, so a concurrent move still aborts
        updates.push_back(RefUpdate{c.ref_name, c.old_target, c.new_target, false});
        if (c.moved()) {
            updates.push_back(RefUpdate{backup_name(c.ref_name), std::nullopt,
                                        c.old_target, overwrite_backups});
        }
    }

    store_.apply_ref_transaction(updates, message);
    for (auto& c : moved) {
        BLOBSTRIP_LOG_INFO("{}: {} -> {} (backup {})", c.ref_name, c.old_target,
                           c.new_target, backup_name(c.ref_name));
    }
    return moved;
}

RollbackReport RefUpdater::rollback(const std::vector<RefChange>& applied,
                                    const std::string& message) {
    RollbackReport report;
    if (applied.empty()) return report;

    std::vector<RefUpdate> updates;
    updates.reserve(applied.size() * 2);
    for (auto& c : applied) {
        updates.push_back(RefUpdate{c.ref_name, c.new_target, c.old_target, false});
        updates.push_back(RefUpdate{backup_name(c.ref_name), c.old_target,
                                    std::nullopt, false});
        report.restored.push_back(RefChange{c.ref_name, c.new_target, c.old_target});
    }

    store_.apply_ref_transaction(updates, message);
    for (auto& c : report.restored) {
        BLOBSTRIP_LOG_INFO("{}: restored {}", c.ref_name, c.new_target);
    }
    return report;
}

} // namespace blobstrip
