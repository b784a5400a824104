#include "blobstrip/object_store.h"
#include "blobstrip/object.h"

namespace blobstrip {

ObjectId ObjectStore::hash(const Object& obj) const {
    return hash_object(obj);
}

void ObjectStore::update_ref(const std::string& name,
                             const ObjectId& old_id,
                             const ObjectId& new_id,
                             const std::string& message) {
    apply_ref_transaction({RefUpdate{name, old_id, new_id, false}}, message);
}

} // namespace blobstrip
