#include "blobstrip/git_store.h"
#include "blobstrip/log.h"
#include "internal.h"

#include <git2.h>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <unordered_set>

namespace blobstrip {

namespace {

// ---------------------------------------------------------------------------
// libgit2 helpers
// ---------------------------------------------------------------------------

std::string last_git_message() {
    const git_error* e = git_error_last();
    return (e && e->message) ? e->message : "unknown error";
}

[[noreturn]] void throw_git(const std::string& ctx) {
    throw GitError(ctx + ": " + last_git_message());
}

std::string oid_hex(const git_oid* o) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), o);
    return std::string(buf, GIT_OID_HEXSZ);
}

git_oid hex_to_oid(const std::string& hex) {
    git_oid oid;
    if (hex.size() != GIT_OID_HEXSZ || git_oid_fromstr(&oid, hex.c_str()) != 0) {
        throw InvalidHashError(hex);
    }
    return oid;
}

git_object_t to_git_type(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::Blob:   return GIT_OBJECT_BLOB;
        case ObjectKind::Tree:   return GIT_OBJECT_TREE;
        case ObjectKind::Commit: return GIT_OBJECT_COMMIT;
        case ObjectKind::Tag:    return GIT_OBJECT_TAG;
    }
    return GIT_OBJECT_INVALID; // unreachable
}

ObjectKind from_git_type(git_object_t type, const ObjectId& id) {
    switch (type) {
        case GIT_OBJECT_BLOB:   return ObjectKind::Blob;
        case GIT_OBJECT_TREE:   return ObjectKind::Tree;
        case GIT_OBJECT_COMMIT: return ObjectKind::Commit;
        case GIT_OBJECT_TAG:    return ObjectKind::Tag;
        default:
            throw CorruptObjectError(id, "unexpected object type " +
                                         std::to_string(static_cast<int>(type)));
    }
}

/// RAII wrapper for git_odb_object*.
struct OdbObjectGuard {
    git_odb_object* o = nullptr;
    ~OdbObjectGuard() { if (o) git_odb_object_free(o); }
};

/// RAII wrapper for git_reference*.
struct RefGuard {
    git_reference* r = nullptr;
    ~RefGuard() { if (r) git_reference_free(r); }
};

/// RAII wrapper for git_reference_iterator*.
struct RefIterGuard {
    git_reference_iterator* it = nullptr;
    ~RefIterGuard() { if (it) git_reference_iterator_free(it); }
};

/// RAII wrapper for git_transaction*. Freeing an uncommitted transaction
/// releases its locks without writing anything.
struct TransactionGuard {
    git_transaction* tx = nullptr;
    ~TransactionGuard() { if (tx) git_transaction_free(tx); }
};

/// RAII wrapper for git_packbuilder*.
struct PackbuilderGuard {
    git_packbuilder* pb = nullptr;
    ~PackbuilderGuard() { if (pb) git_packbuilder_free(pb); }
};

/// RAII wrapper for git_reflog*.
struct ReflogGuard {
    git_reflog* r = nullptr;
    ~ReflogGuard() { if (r) git_reflog_free(r); }
};

git_repository* open_repo(const std::filesystem::path& path) {
    git_repository* repo = nullptr;
    if (git_repository_open_ext(&repo, path.string().c_str(),
                                GIT_REPOSITORY_OPEN_NO_SEARCH, nullptr) != 0) {
        throw StoreUnavailableError("cannot open " + path.string() + ": " +
                                    last_git_message());
    }
    return repo;
}

/// Direct target of `name`, or nullopt if it does not exist.
std::optional<ObjectId> lookup_direct(git_repository* repo, const std::string& name) {
    RefGuard ref;
    int rc = git_reference_lookup(&ref.r, repo, name.c_str());
    if (rc == GIT_ENOTFOUND) return std::nullopt;
    if (rc != 0) throw_git("git_reference_lookup " + name);

    RefGuard resolved;
    if (git_reference_resolve(&resolved.r, ref.r) != 0) {
        return std::nullopt; // dangling symbolic ref
    }
    const git_oid* target = git_reference_target(resolved.r);
    if (!target) return std::nullopt;
    return oid_hex(target);
}

std::vector<ObjectId> list_all(git_odb* odb) {
    std::unordered_set<ObjectId> seen;
    auto cb = [](const git_oid* id, void* payload) -> int {
        static_cast<std::unordered_set<ObjectId>*>(payload)->insert(oid_hex(id));
        return 0;
    };
    if (git_odb_foreach(odb, cb, &seen) != 0) throw_git("git_odb_foreach");
    return std::vector<ObjectId>(seen.begin(), seen.end());
}

/// Loose object file for `id` under `gitdir`.
std::filesystem::path loose_path(const std::filesystem::path& gitdir, const ObjectId& id) {
    return gitdir / "objects" / id.substr(0, 2) / id.substr(2);
}

/// Write one pack holding `keep` and delete every other pack.
void repack(git_repository* repo, const std::filesystem::path& gitdir,
            const std::vector<ObjectId>& keep) {
    namespace fss = std::filesystem;
    auto pack_dir = gitdir / "objects" / "pack";

    std::string new_name;
    if (!keep.empty()) {
        PackbuilderGuard pb;
        if (git_packbuilder_new(&pb.pb, repo) != 0) throw_git("git_packbuilder_new");
        for (auto& id : keep) {
            git_oid oid = hex_to_oid(id);
            if (git_packbuilder_insert(pb.pb, &oid, nullptr) != 0)
                throw_git("git_packbuilder_insert " + id);
        }
        fss::create_directories(pack_dir);
        if (git_packbuilder_write(pb.pb, pack_dir.string().c_str(), 0,
                                  nullptr, nullptr) != 0)
            throw_git("git_packbuilder_write");
        new_name = std::string("pack-") + git_packbuilder_name(pb.pb);
        BLOBSTRIP_LOG_DEBUG("wrote {} with {} objects", new_name, keep.size());

        // Drop loose copies of what is now packed
        for (auto& id : keep) {
            auto p = loose_path(gitdir, id);
            std::error_code ec;
            if (fss::remove(p, ec)) fss::remove(p.parent_path(), ec);
        }
    }

    if (!fss::exists(pack_dir)) return;
    std::vector<fss::path> stale;
    for (auto& entry : fss::directory_iterator(pack_dir)) {
        auto stem = entry.path().stem().string();
        if (stem.rfind("pack-", 0) == 0 && stem != new_name) stale.push_back(entry.path());
    }
    for (auto& p : stale) {
        std::error_code ec;
        fss::remove(p, ec);
        if (ec) throw IoError("cannot remove " + p.string() + ": " + ec.message());
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// GitStoreInner
// ---------------------------------------------------------------------------

GitStoreInner::GitStoreInner(git_repository* r, std::filesystem::path p)
    : repo(r), path(std::move(p)), gitdir(git_repository_path(r)) {}

GitStoreInner::~GitStoreInner() {
    if (odb_handle) git_odb_free(odb_handle);
    if (repo) git_repository_free(repo);
}

git_odb* GitStoreInner::odb() {
    if (!odb_handle && git_repository_odb(&odb_handle, repo) != 0) {
        throw_git("git_repository_odb");
    }
    return odb_handle;
}

void GitStoreInner::reopen() {
    git_repository* fresh = open_repo(path);
    if (odb_handle) {
        git_odb_free(odb_handle);
        odb_handle = nullptr;
    }
    git_repository_free(repo);
    repo = fresh;
}

// ---------------------------------------------------------------------------
// GitObjectStore::open
// ---------------------------------------------------------------------------

GitObjectStore GitObjectStore::open(const std::filesystem::path& path, OpenOptions opts) {
    git_repository* repo = nullptr;

    if (std::filesystem::exists(path)) {
        repo = open_repo(path);
    } else if (opts.create) {
        std::filesystem::create_directories(path);
        if (git_repository_init(&repo, path.string().c_str(), 1 /*bare*/) != 0) {
            throw StoreUnavailableError("cannot create " + path.string() + ": " +
                                        last_git_message());
        }
        // Reflogs in bare repos, so ref moves can be audited
        git_config* cfg = nullptr;
        if (git_repository_config(&cfg, repo) == 0) {
            git_config_set_string(cfg, "core.logAllRefUpdates", "always");
            git_config_free(cfg);
        }
    } else {
        throw StoreUnavailableError("repository not found: " + path.string());
    }

    BLOBSTRIP_LOG_DEBUG("opened repository {}", git_repository_path(repo));
    auto inner = std::make_shared<GitStoreInner>(repo, path);
    return GitObjectStore(std::move(inner));
}

GitObjectStore::GitObjectStore(std::shared_ptr<GitStoreInner> inner)
    : inner_(std::move(inner)) {}

const std::filesystem::path& GitObjectStore::path() const { return inner_->path; }

const std::filesystem::path& GitObjectStore::gitdir() const { return inner_->gitdir; }

// ---------------------------------------------------------------------------
// Objects
// ---------------------------------------------------------------------------

Object GitObjectStore::get(const ObjectId& id) {
    git_oid oid = hex_to_oid(id);
    std::lock_guard<std::mutex> lk(inner_->mutex);

    OdbObjectGuard og;
    int rc = git_odb_read(&og.o, inner_->odb(), &oid);
    if (rc == GIT_ENOTFOUND) throw MissingObjectError(id);
    if (rc != 0) throw CorruptObjectError(id, last_git_message());

    Object obj;
    obj.kind = from_git_type(git_odb_object_type(og.o), id);
    auto ptr = static_cast<const uint8_t*>(git_odb_object_data(og.o));
    obj.data.assign(ptr, ptr + git_odb_object_size(og.o));
    return obj;
}

ObjectHeader GitObjectStore::stat(const ObjectId& id) {
    git_oid oid = hex_to_oid(id);
    std::lock_guard<std::mutex> lk(inner_->mutex);

    size_t len = 0;
    git_object_t type = GIT_OBJECT_INVALID;
    int rc = git_odb_read_header(&len, &type, inner_->odb(), &oid);
    if (rc == GIT_ENOTFOUND) throw MissingObjectError(id);
    if (rc != 0) throw CorruptObjectError(id, last_git_message());
    return ObjectHeader{from_git_type(type, id), static_cast<uint64_t>(len)};
}

bool GitObjectStore::contains(const ObjectId& id) {
    git_oid oid = hex_to_oid(id);
    std::lock_guard<std::mutex> lk(inner_->mutex);
    return git_odb_exists(inner_->odb(), &oid) == 1;
}

ObjectId GitObjectStore::put(const Object& obj) {
    std::lock_guard<std::mutex> lk(inner_->mutex);
    git_oid oid;
    const void* data = obj.data.empty() ? static_cast<const void*>("") : obj.data.data();
    if (git_odb_write(&oid, inner_->odb(), data, obj.data.size(),
                      to_git_type(obj.kind)) != 0) {
        throw_git("git_odb_write");
    }
    return oid_hex(&oid);
}

std::vector<ObjectId> GitObjectStore::list_objects() {
    std::lock_guard<std::mutex> lk(inner_->mutex);
    return list_all(inner_->odb());
}

void GitObjectStore::remove_objects(const std::vector<ObjectId>& ids) {
    if (ids.empty()) return;
    namespace fss = std::filesystem;
    std::lock_guard<std::mutex> lk(inner_->mutex);

    std::unordered_set<ObjectId> doomed(ids.begin(), ids.end());
    for (auto& id : doomed) {
        auto p = loose_path(inner_->gitdir, id);
        std::error_code ec;
        if (fss::remove(p, ec)) {
            fss::remove(p.parent_path(), ec); // only succeeds when empty
            continue;
        }
        if (ec) throw IoError("cannot remove " + p.string() + ": " + ec.message());
    }
    inner_->reopen();

    // A loose object may also have a copy in a pack
    bool packed = false;
    for (auto& id : doomed) {
        git_oid oid = hex_to_oid(id);
        if (git_odb_exists(inner_->odb(), &oid) == 1) {
            packed = true;
            break;
        }
    }

    if (packed) {
        std::vector<ObjectId> keep;
        for (auto& id : list_all(inner_->odb())) {
            if (!doomed.count(id)) keep.push_back(id);
        }
        repack(inner_->repo, inner_->gitdir, keep);
        inner_->reopen();
    }
    BLOBSTRIP_LOG_DEBUG("removed {} objects{}", doomed.size(), packed ? " (repacked)" : "");
}

// ---------------------------------------------------------------------------
// Refs
// ---------------------------------------------------------------------------

std::vector<RefEntry> GitObjectStore::iterate_refs() {
    std::lock_guard<std::mutex> lk(inner_->mutex);
    std::vector<RefEntry> out;

    RefIterGuard iter;
    if (git_reference_iterator_new(&iter.it, inner_->repo) != 0)
        throw_git("git_reference_iterator_new");

    git_reference* raw = nullptr;
    int rc;
    while ((rc = git_reference_next(&raw, iter.it)) == 0) {
        RefGuard ref{raw};
        const char* name = git_reference_name(ref.r);
        if (!name || std::strcmp(name, "HEAD") == 0) continue;
        if (git_reference_type(ref.r) != GIT_REFERENCE_DIRECT) continue;
        const git_oid* target = git_reference_target(ref.r);
        if (target) out.push_back({name, oid_hex(target)});
    }
    if (rc != GIT_ITEROVER) throw_git("git_reference_next");

    std::sort(out.begin(), out.end(),
              [](const RefEntry& a, const RefEntry& b) { return a.name < b.name; });
    return out;
}

std::optional<ObjectId> GitObjectStore::read_ref(const std::string& name) {
    std::lock_guard<std::mutex> lk(inner_->mutex);
    return lookup_direct(inner_->repo, name);
}

void GitObjectStore::apply_ref_transaction(const std::vector<RefUpdate>& updates,
                                           const std::string& message) {
    for (auto& u : updates) paths::validate_ref_name(u.name);
    std::lock_guard<std::mutex> lk(inner_->mutex);

    TransactionGuard tx;
    if (git_transaction_new(&tx.tx, inner_->repo) != 0) throw_git("git_transaction_new");

    // Lock every ref first so nobody can move them between check and write
    for (auto& u : updates) {
        if (git_transaction_lock_ref(tx.tx, u.name.c_str()) != 0) {
            BLOBSTRIP_LOG_WARN("cannot lock {}: {}", u.name, last_git_message());
            throw RefConflictError(u.name);
        }
    }

    for (auto& u : updates) {
        if (u.force) continue;
        auto current = lookup_direct(inner_->repo, u.name);
        if (current != u.expected) {
            BLOBSTRIP_LOG_WARN("ref {} expected {} but found {}", u.name,
                               u.expected.value_or("<none>"),
                               current.value_or("<none>"));
            throw RefConflictError(u.name);
        }
    }

    size_t writes = 0;
    for (auto& u : updates) {
        if (!u.force && u.target == u.expected) continue; // verify only
        if (u.target) {
            git_oid oid = hex_to_oid(*u.target);
            if (git_transaction_set_target(tx.tx, u.name.c_str(), &oid,
                                           nullptr, message.c_str()) != 0)
                throw_git("git_transaction_set_target " + u.name);
        } else {
            if (git_transaction_remove(tx.tx, u.name.c_str()) != 0)
                throw_git("git_transaction_remove " + u.name);
        }
        ++writes;
    }

    if (git_transaction_commit(tx.tx) != 0) throw_git("git_transaction_commit");

    // A deleted ref takes its reflog with it
    for (auto& u : updates) {
        if (u.target || (!u.force && !u.expected)) continue;
        int rc = git_reflog_delete(inner_->repo, u.name.c_str());
        if (rc != 0 && rc != GIT_ENOTFOUND) throw_git("git_reflog_delete " + u.name);
    }
    BLOBSTRIP_LOG_DEBUG("ref transaction: {} checked, {} written", updates.size(), writes);
}

size_t GitObjectStore::expire_reflogs() {
    std::vector<std::string> names{"HEAD"};
    for (auto& r : iterate_refs()) names.push_back(r.name);

    std::lock_guard<std::mutex> lk(inner_->mutex);
    size_t dropped = 0;
    for (auto& name : names) {
        ReflogGuard log;
        if (git_reflog_read(&log.r, inner_->repo, name.c_str()) != 0) continue;
        if (git_reflog_entrycount(log.r) == 0) continue;
        if (git_reflog_delete(inner_->repo, name.c_str()) != 0)
            throw_git("git_reflog_delete " + name);
        ++dropped;
    }
    return dropped;
}

// ---------------------------------------------------------------------------
// Journal
// ---------------------------------------------------------------------------

std::optional<std::string> GitObjectStore::read_journal() {
    auto p = inner_->gitdir / "blobstrip-journal.json";
    std::ifstream in(p, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void GitObjectStore::write_journal(const std::string& text) {
    auto p   = inner_->gitdir / "blobstrip-journal.json";
    auto tmp = inner_->gitdir / "blobstrip-journal.json.tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw IoError("cannot write " + tmp.string());
        out << text;
        if (!out.flush()) throw IoError("cannot write " + tmp.string());
    }
    std::error_code ec;
    std::filesystem::rename(tmp, p, ec);
    if (ec) throw IoError("cannot rename journal: " + ec.message());
}

bool GitObjectStore::clear_journal() {
    std::error_code ec;
    bool removed = std::filesystem::remove(inner_->gitdir / "blobstrip-journal.json", ec);
    if (ec) throw IoError("cannot remove journal: " + ec.message());
    return removed;
}

// ---------------------------------------------------------------------------
// Locking
// ---------------------------------------------------------------------------

std::unique_ptr<StoreLock>
GitObjectStore::lock(LockMode mode, std::chrono::milliseconds timeout) {
    return lock::acquire_file_lock(inner_->gitdir / "blobstrip.lock", mode, timeout);
}

} // namespace blobstrip
