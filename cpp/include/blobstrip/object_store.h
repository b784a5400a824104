#pragma once

/// @file object_store.h
/// Read/write access to content-addressed objects and refs.

#include "types.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace blobstrip {

/// Held exclusive writer lock; released on destruction.
class StoreLock {
public:
    virtual ~StoreLock() = default;
};

/// Abstract object database plus ref namespace.
///
/// Implementations must be safe to call from several threads; object reads
/// and writes are synchronous.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // -- Objects ------------------------------------------------------------

    /// Read an object.
    /// @throws MissingObjectError if `id` is not stored.
    virtual Object get(const ObjectId& id) = 0;

    /// Kind and size of an object without reading its payload.
    /// @throws MissingObjectError if `id` is not stored.
    virtual ObjectHeader stat(const ObjectId& id) = 0;

    virtual bool contains(const ObjectId& id) = 0;

    /// Store `obj` and return its id. Storing existing content is a no-op.
    virtual ObjectId put(const Object& obj) = 0;

    /// Id `obj` would be stored under. Never writes.
    virtual ObjectId hash(const Object& obj) const;

    /// Every stored object id (order unspecified).
    virtual std::vector<ObjectId> list_objects() = 0;

    /// Physically discard the given objects.
    virtual void remove_objects(const std::vector<ObjectId>& ids) = 0;

    // -- Refs ---------------------------------------------------------------

    /// All direct refs, sorted by name. Symbolic refs and HEAD are skipped.
    virtual std::vector<RefEntry> iterate_refs() = 0;

    /// Current value of a direct ref, or nullopt if it does not exist.
    virtual std::optional<ObjectId> read_ref(const std::string& name) = 0;

    /// Apply every update or none.
    /// @throws RefConflictError naming the first ref whose current value
    ///         differs from its `expected` value.
    virtual void apply_ref_transaction(const std::vector<RefUpdate>& updates,
                                       const std::string& message) = 0;

    /// Compare-and-swap a single ref from `old_id` to `new_id`.
    /// @throws RefConflictError if the ref no longer points at `old_id`.
    void update_ref(const std::string& name,
                    const ObjectId& old_id,
                    const ObjectId& new_id,
                    const std::string& message = "blobstrip: update-ref");

    /// Drop per-ref undo history (reflogs). Returns the number dropped.
    virtual size_t expire_reflogs() = 0;

    // -- Journal ------------------------------------------------------------

    /// Transient undo log of the last unconfirmed rewrite.
    virtual std::optional<std::string> read_journal() = 0;
    virtual void write_journal(const std::string& text) = 0;
    /// Returns true if a journal existed.
    virtual bool clear_journal() = 0;

    // -- Locking ------------------------------------------------------------

    /// Acquire the exclusive writer lock.
    /// @throws StoreUnavailableError when it cannot be acquired.
    virtual std::unique_ptr<StoreLock>
    lock(LockMode mode, std::chrono::milliseconds timeout) = 0;
};

} // namespace blobstrip
