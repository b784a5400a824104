#pragma once

#include "object_store.h"

#include <map>
#include <mutex>
#include <unordered_map>

namespace blobstrip {

/// ObjectStore kept entirely in memory. Ids are real git ids, so content
/// written here hashes exactly as it would in a repository.
class MemoryObjectStore : public ObjectStore {
public:
    MemoryObjectStore() = default;
    MemoryObjectStore(const MemoryObjectStore&) = delete;
    MemoryObjectStore& operator=(const MemoryObjectStore&) = delete;

    Object       get(const ObjectId& id) override;
    ObjectHeader stat(const ObjectId& id) override;
    bool         contains(const ObjectId& id) override;
    ObjectId     put(const Object& obj) override;

    std::vector<ObjectId> list_objects() override;
    void remove_objects(const std::vector<ObjectId>& ids) override;

    std::vector<RefEntry>   iterate_refs() override;
    std::optional<ObjectId> read_ref(const std::string& name) override;
    void apply_ref_transaction(const std::vector<RefUpdate>& updates,
                               const std::string& message) override;

    /// Sets a ref unconditionally (fixture setup).
    void set_ref(const std::string& name, const ObjectId& target);

    size_t expire_reflogs() override;

    std::optional<std::string> read_journal() override;
    void write_journal(const std::string& text) override;
    bool clear_journal() override;

    std::unique_ptr<StoreLock>
    lock(LockMode mode, std::chrono::milliseconds timeout) override;

    /// Number of put() calls that stored new content.
    size_t write_count() const;

    /// Number of stored objects.
    size_t object_count() const;

    /// Reflog messages recorded for `name`, oldest first.
    std::vector<std::string> reflog(const std::string& name) const;

private:
    mutable std::mutex                             mutex_;
    std::unordered_map<ObjectId, Object>           objects_;
    std::map<std::string, ObjectId>                refs_;
    std::map<std::string, std::vector<std::string>> reflogs_;
    std::optional<std::string>                     journal_;
    size_t                                         writes_ = 0;
    std::timed_mutex                               writer_;
};

} // namespace blobstrip
