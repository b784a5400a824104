#include "blobstrip/memory_store.h"
#include "blobstrip/log.h"
#include "blobstrip/object.h"
#include "internal.h"

#include <algorithm>

namespace blobstrip {

namespace {

/// Releases the store's writer mutex.
class TimedMutexLock : public StoreLock {
public:
    explicit TimedMutexLock(std::timed_mutex& m) : m_(m) {}
    ~TimedMutexLock() override { m_.unlock(); }
    TimedMutexLock(const TimedMutexLock&) = delete;
    TimedMutexLock& operator=(const TimedMutexLock&) = delete;

private:
    std::timed_mutex& m_;
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Objects
// ---------------------------------------------------------------------------

Object MemoryObjectStore::get(const ObjectId& id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = objects_.find(id);
    if (it == objects_.end()) throw MissingObjectError(id);
    return it->second;
}

ObjectHeader MemoryObjectStore::stat(const ObjectId& id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = objects_.find(id);
    if (it == objects_.end()) throw MissingObjectError(id);
    return ObjectHeader{it->second.kind, it->second.data.size()};
}

bool MemoryObjectStore::contains(const ObjectId& id) {
    std::lock_guard<std::mutex> lk(mutex_);
    return objects_.count(id) != 0;
}

ObjectId MemoryObjectStore::put(const Object& obj) {
    ObjectId id = hash_object(obj);
    std::lock_guard<std::mutex> lk(mutex_);
    if (objects_.emplace(id, obj).second) ++writes_;
    return id;
}

std::vector<ObjectId> MemoryObjectStore::list_objects() {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<ObjectId> out;
    out.reserve(objects_.size());
    for (auto& [id, obj] : objects_) out.push_back(id);
    return out;
}

void MemoryObjectStore::remove_objects(const std::vector<ObjectId>& ids) {
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& id : ids) objects_.erase(id);
}

size_t MemoryObjectStore::write_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return writes_;
}

size_t MemoryObjectStore::object_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return objects_.size();
}

// ---------------------------------------------------------------------------
// Refs
// ---------------------------------------------------------------------------

std::vector<RefEntry> MemoryObjectStore::iterate_refs() {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<RefEntry> out;
    out.reserve(refs_.size());
    for (auto& [name, target] : refs_) {
        if (name == "HEAD") continue;
        out.push_back({name, target});
    }
    return out;
}

std::optional<ObjectId> MemoryObjectStore::read_ref(const std::string& name) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = refs_.find(name);
    if (it == refs_.end()) return std::nullopt;
    return it->second;
}

void MemoryObjectStore::set_ref(const std::string& name, const ObjectId& target) {
    paths::validate_ref_name(name);
    std::lock_guard<std::mutex> lk(mutex_);
    refs_[name] = target;
}

void MemoryObjectStore::apply_ref_transaction(const std::vector<RefUpdate>& updates,
                                              const std::string& message) {
    for (auto& u : updates) paths::validate_ref_name(u.name);

    std::lock_guard<std::mutex> lk(mutex_);

    // Verify everything before touching anything
    for (auto& u : updates) {
        if (u.force) continue;
        auto it = refs_.find(u.name);
        std::optional<ObjectId> current;
        if (it != refs_.end()) current = it->second;
        if (current != u.expected) {
            BLOBSTRIP_LOG_WARN("ref {} expected {} but found {}", u.name,
                               u.expected.value_or("<none>"),
                               current.value_or("<none>"));
            throw RefConflictError(u.name);
        }
    }

    for (auto& u : updates) {
        if (!u.force && u.target == u.expected) continue; // verify only
        if (u.target) {
            refs_[u.name] = *u.target;
            reflogs_[u.name].push_back(message);
        } else {
            refs_.erase(u.name);
            reflogs_.erase(u.name);
        }
    }
}

size_t MemoryObjectStore::expire_reflogs() {
    std::lock_guard<std::mutex> lk(mutex_);
    size_t n = reflogs_.size();
    reflogs_.clear();
    return n;
}

std::vector<std::string> MemoryObjectStore::reflog(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = reflogs_.find(name);
    if (it == reflogs_.end()) return {};
    return it->second;
}

// ---------------------------------------------------------------------------
// Journal
// ---------------------------------------------------------------------------

std::optional<std::string> MemoryObjectStore::read_journal() {
    std::lock_guard<std::mutex> lk(mutex_);
    return journal_;
}

void MemoryObjectStore::write_journal(const std::string& text) {
    std::lock_guard<std::mutex> lk(mutex_);
    journal_ = text;
}

bool MemoryObjectStore::clear_journal() {
    std::lock_guard<std::mutex> lk(mutex_);
    bool had = journal_.has_value();
    journal_.reset();
    return had;
}

// ---------------------------------------------------------------------------
// Locking
// ---------------------------------------------------------------------------

std::unique_ptr<StoreLock>
MemoryObjectStore::lock(LockMode mode, std::chrono::milliseconds timeout) {
    bool acquired = mode == LockMode::Try ? writer_.try_lock()
                                          : writer_.try_lock_for(timeout);
    if (!acquired) throw StoreUnavailableError("memory store is locked");
    return std::make_unique<TimedMutexLock>(writer_);
}

} // namespace blobstrip
