#pragma once

/// @file gc.h
/// Confirmation-gated cleanup after a rewrite.

#include "object_store.h"
#include "types.h"

#include <string>
#include <unordered_set>
#include <vector>

namespace blobstrip {

/// Expires backup refs, the rewrite journal and reflogs, then removes
/// every object not reachable from the remaining refs.
class GarbageCollector {
public:
    explicit GarbageCollector(ObjectStore& store) : store_(store) {}

    /// @throws GcPreconditionError without `opts.confirm`, or while another
    ///         writer holds the store lock.
    /// @throws MissingObjectError if a remaining ref reaches a missing
    ///         object (nothing is removed then).
    GcReport run(const GcOptions& opts);

    /// Every object reachable from `roots` through tag, commit, tree and
    /// parent edges. Gitlinks are not followed.
    std::unordered_set<ObjectId> mark(const std::vector<ObjectId>& roots);

private:
    ObjectStore& store_;
};

} // namespace blobstrip
