#pragma once

/// @file filter.h
/// Blob classification under a size/path policy.

#include "types.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace blobstrip {

/// Verdict for a single blob at a single path.
struct Classification {
    enum class Action : uint8_t { Keep, Strip };

    Action                action = Action::Keep;
    std::optional<Object> replacement; ///< Unset for Keep and for Drop mode.

    bool keep() const  { return action == Action::Keep; }
    bool strip() const { return action == Action::Strip; }
};

/// Applies a Policy to blobs. Stateless and safe to share between threads.
class FilterEngine {
public:
    /// Largest blob that can be a tombstone written by this tool.
    static constexpr uint64_t kMaxTombstoneSize = 256;

    /// @throws PolicyInvalidError if `policy` does not validate.
    explicit FilterEngine(Policy policy);

    /// Classify blob `id` of `size` bytes found at `path`.
    ///
    /// `read_content` is only called for small offending blobs, to
    /// recognise tombstones from an earlier pass; without it such blobs
    /// are classified on size alone.
    Classification classify(
        const ObjectId& id,
        uint64_t size,
        const std::string& path,
        const std::function<std::vector<uint8_t>()>& read_content = {}) const;

    /// True if `path` satisfies the path predicate (always true when none
    /// is configured).
    bool path_matches(const std::string& path) const;

    /// True when decisions depend on the path, not only on the blob.
    bool path_dependent() const { return policy_.has_path_predicate(); }

    const Policy& policy() const { return policy_; }

    /// Replacement blob noting the original id and size.
    static Object make_tombstone(const ObjectId& id, uint64_t size);

    /// True if `content` is a tombstone produced by make_tombstone().
    static bool is_tombstone(const std::vector<uint8_t>& content);

private:
    Policy policy_;
};

} // namespace blobstrip
