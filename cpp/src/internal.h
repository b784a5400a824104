#pragma once
/// Internal helpers shared between blobstrip source files.
/// Not part of the public API.

#include "blobstrip/error.h"
#include "blobstrip/object_store.h"
#include "blobstrip/types.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace blobstrip {

// ---------------------------------------------------------------------------
// paths: ref names and repository paths
// ---------------------------------------------------------------------------

namespace paths {

void        validate_ref_name(const std::string& name);
std::string join(const std::string& dir, const std::string& name);

} // namespace paths

// ---------------------------------------------------------------------------
// lock: advisory file lock
// ---------------------------------------------------------------------------

namespace lock {

/// Take an exclusive advisory lock on `lock_path`.
/// @throws StoreUnavailableError when it cannot be taken in time.
std::unique_ptr<StoreLock> acquire_file_lock(const std::filesystem::path& lock_path,
                                             LockMode mode,
                                             std::chrono::milliseconds timeout);

} // namespace lock

// ---------------------------------------------------------------------------
// glob: path predicate matching
// ---------------------------------------------------------------------------

namespace glob {

/// Match a glob pattern segment against a name.
bool fnmatch(const std::string& pattern, const std::string& name);

/// Match a pattern against a slash-separated repository path.
/// Patterns without '/' match the basename at any depth; others match the
/// whole path, with `**` spanning zero or more directories.
bool path_match(const std::string& pattern, const std::string& path);

/// @throws PolicyInvalidError for an empty pattern, an empty or ".."
///         segment, or an unterminated character class.
void validate_pattern(const std::string& pattern);

} // namespace glob

} // namespace blobstrip
