#include "blobstrip/filter.h"
#include "blobstrip/object.h"
#include "internal.h"

#include <cstring>

namespace blobstrip {

namespace {

constexpr const char* kTombstonePrefix = "blobstrip: removed blob ";

} // anonymous namespace

// ---------------------------------------------------------------------------
// Policy
// ---------------------------------------------------------------------------

const char* strip_mode_name(StripMode mode) {
    switch (mode) {
        case StripMode::Tombstone: return "tombstone";
        case StripMode::Empty:     return "empty";
        case StripMode::Drop:      return "drop";
    }
    return "tombstone";
}

std::optional<StripMode> strip_mode_from_name(const std::string& name) {
    if (name == "tombstone") return StripMode::Tombstone;
    if (name == "empty")     return StripMode::Empty;
    if (name == "drop")      return StripMode::Drop;
    return std::nullopt;
}

void Policy::validate() const {
    if (size_threshold_bytes <= 0) {
        throw PolicyInvalidError("size threshold must be positive, got " +
                                 std::to_string(size_threshold_bytes));
    }
    if (path_patterns) {
        for (auto& p : *path_patterns) glob::validate_pattern(p);
    }
}

// ---------------------------------------------------------------------------
// FilterEngine
// ---------------------------------------------------------------------------

FilterEngine::FilterEngine(Policy policy) : policy_(std::move(policy)) {
    policy_.validate();
}

bool FilterEngine::path_matches(const std::string& path) const {
    if (!policy_.has_path_predicate()) return true;
    for (auto& pattern : *policy_.path_patterns) {
        if (glob::path_match(pattern, path)) return true;
    }
    return false;
}

Classification FilterEngine::classify(
        const ObjectId& id,
        uint64_t size,
        const std::string& path,
        const std::function<std::vector<uint8_t>()>& read_content) const {
    Classification c;
    if (size <= static_cast<uint64_t>(policy_.size_threshold_bytes)) return c;
    if (!path_matches(path)) return c;

    // Our own tombstones stay put, so a second pass changes nothing
    if (size <= kMaxTombstoneSize && read_content && is_tombstone(read_content())) {
        return c;
    }

    c.action = Classification::Action::Strip;
    switch (policy_.strip_mode) {
        case StripMode::Tombstone:
            c.replacement = make_tombstone(id, size);
            break;
        case StripMode::Empty:
            c.replacement = Object::blob(std::vector<uint8_t>{});
            break;
        case StripMode::Drop:
            break;
    }
    return c;
}

Object FilterEngine::make_tombstone(const ObjectId& id, uint64_t size) {
    return Object::blob(std::string(kTombstonePrefix) + id + " (" +
                        std::to_string(size) + " bytes)\n");
}

bool FilterEngine::is_tombstone(const std::vector<uint8_t>& content) {
    size_t n = std::strlen(kTombstonePrefix);
    if (content.size() < n || content.size() > kMaxTombstoneSize) return false;
    if (std::memcmp(content.data(), kTombstonePrefix, n) != 0) return false;
    return content.back() == '\n';
}

} // namespace blobstrip
