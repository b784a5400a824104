#pragma once

/// @file blobstrip.h
/// Umbrella header. Include this to get the full blobstrip C++ API.

#include "error.h"
#include "types.h"
#include "object.h"
#include "object_store.h"
#include "git_store.h"
#include "memory_store.h"
#include "filter.h"
#include "translation_table.h"
#include "walker.h"
#include "ref_updater.h"
#include "gc.h"
#include "rewriter.h"
#include "json.h"
#include "log.h"

#include <algorithm>
#include <chrono>
#include <thread>
#include <type_traits>

namespace blobstrip {

/// Retry a whole rewrite pass with exponential backoff on RefConflictError.
///
/// Calls `f()` up to 6 times (1 initial + 5 retries).  On each
/// RefConflictError, sleeps min(10 * 2^attempt, 200) ms before retrying.
/// Objects written by a failed attempt are content-addressed and are
/// reused by the next one.
///
/// @code
///     auto report = blobstrip::retry_rewrite([&]() {
///         return rewriter.rewrite(policy);
///     });
/// @endcode
template <typename F>
auto retry_rewrite(F&& f) -> decltype(f()) {
    constexpr int max_retries = 5;
    for (int attempt = 0; ; ++attempt) {
        try {
            return f();
        } catch (const RefConflictError& e) {
            if (attempt >= max_retries) throw;
            BLOBSTRIP_LOG_WARN("{}; retrying (attempt {})", e.what(), attempt + 1);
            int delay_ms = std::min(10 * (1 << attempt), 200);
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
    }
}

} // namespace blobstrip
