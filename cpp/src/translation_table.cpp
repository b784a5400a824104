#include "blobstrip/translation_table.h"

#include <mutex>

namespace blobstrip {

ObjectId TranslationTable::record(const ObjectId& old_id, const ObjectId& new_id) {
    std::unique_lock<std::shared_mutex> lk(mutex_);
    auto [it, inserted] = map_.emplace(old_id, new_id);
    if (inserted && old_id != new_id) ++changed_;
    return it->second;
}

std::optional<ObjectId> TranslationTable::lookup(const ObjectId& old_id) const {
    std::shared_lock<std::shared_mutex> lk(mutex_);
    auto it = map_.find(old_id);
    if (it == map_.end()) return std::nullopt;
    return it->second;
}

ObjectId TranslationTable::at(const ObjectId& old_id) const {
    auto found = lookup(old_id);
    if (!found) throw BlobstripError("no translation recorded for " + old_id);
    return *found;
}

ObjectId TranslationTable::translate(const ObjectId& old_id) const {
    return lookup(old_id).value_or(old_id);
}

bool TranslationTable::contains(const ObjectId& old_id) const {
    std::shared_lock<std::shared_mutex> lk(mutex_);
    return map_.count(old_id) != 0;
}

size_t TranslationTable::size() const {
    std::shared_lock<std::shared_mutex> lk(mutex_);
    return map_.size();
}

size_t TranslationTable::changed_count() const {
    std::shared_lock<std::shared_mutex> lk(mutex_);
    return changed_;
}

std::map<ObjectId, ObjectId> TranslationTable::snapshot() const {
    std::shared_lock<std::shared_mutex> lk(mutex_);
    return std::map<ObjectId, ObjectId>(map_.begin(), map_.end());
}

} // namespace blobstrip
