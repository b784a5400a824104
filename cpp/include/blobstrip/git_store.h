#pragma once

#include "object_store.h"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

// Forward-declare libgit2 types to avoid pulling the header into every TU.
struct git_repository;
struct git_odb;

namespace blobstrip {

// ---------------------------------------------------------------------------
// GitStoreInner: shared libgit2 state
// ---------------------------------------------------------------------------

/// Internal state shared by GitObjectStore copies.
/// Not part of the public API.
struct GitStoreInner {
    git_repository*       repo;   ///< Raw libgit2 handle (owned).
    git_odb*              odb_handle = nullptr; ///< Lazily opened, owned.
    std::filesystem::path path;   ///< Path the repository was opened from.
    std::filesystem::path gitdir; ///< Resolved git directory.
    std::mutex            mutex;  ///< Serializes all libgit2 calls.

    GitStoreInner(const GitStoreInner&) = delete;
    GitStoreInner& operator=(const GitStoreInner&) = delete;

    ~GitStoreInner();
    GitStoreInner(git_repository* r, std::filesystem::path p);

    /// Object database of `repo` (borrowed, owned by the repository).
    git_odb* odb();

    /// Drop and reopen the repository handle so no cached object survives
    /// a physical removal.
    void reopen();
};

// ---------------------------------------------------------------------------
// GitObjectStore
// ---------------------------------------------------------------------------

/// ObjectStore backed by a git repository (bare or with a work tree)
/// through libgit2.
///
/// Cheap to copy; internally holds a shared_ptr<GitStoreInner>.
///
/// @code
///     auto store = blobstrip::GitObjectStore::open("/path/to/repo.git");
///     blobstrip::HistoryRewriter rewriter(store);
///     auto report = rewriter.verify(policy);
/// @endcode
class GitObjectStore : public ObjectStore {
public:
    /// Open an existing repository, or create a bare one when
    /// `opts.create` is set.
    /// @throws StoreUnavailableError if it does not exist or cannot be opened.
    static GitObjectStore open(const std::filesystem::path& path,
                               OpenOptions opts = {});

    Object       get(const ObjectId& id) override;
    ObjectHeader stat(const ObjectId& id) override;
    bool         contains(const ObjectId& id) override;
    ObjectId     put(const Object& obj) override;

    std::vector<ObjectId> list_objects() override;

    /// Deletes loose objects; when any of `ids` lives in a pack, every pack
    /// is rewritten into a single pack of the surviving objects.
    void remove_objects(const std::vector<ObjectId>& ids) override;

    std::vector<RefEntry>   iterate_refs() override;
    std::optional<ObjectId> read_ref(const std::string& name) override;

    /// Uses a libgit2 ref transaction: all refs are locked, verified and
    /// only then written.
    void apply_ref_transaction(const std::vector<RefUpdate>& updates,
                               const std::string& message) override;

    size_t expire_reflogs() override;

    /// Journal lives in `<gitdir>/blobstrip-journal.json`.
    std::optional<std::string> read_journal() override;
    void write_journal(const std::string& text) override;
    bool clear_journal() override;

    /// Advisory flock on `<gitdir>/blobstrip.lock`.
    std::unique_ptr<StoreLock>
    lock(LockMode mode, std::chrono::milliseconds timeout) override;

    /// Path the repository was opened from.
    const std::filesystem::path& path() const;

    /// Resolved git directory.
    const std::filesystem::path& gitdir() const;

    std::shared_ptr<GitStoreInner> inner() const { return inner_; }

private:
    explicit GitObjectStore(std::shared_ptr<GitStoreInner> inner);

    std::shared_ptr<GitStoreInner> inner_;
};

} // namespace blobstrip
