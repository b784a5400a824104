#pragma once

/// @file walker.h
/// Topological rewrite of the commit graph.

#include "filter.h"
#include "object_store.h"
#include "translation_table.h"
#include "types.h"

#include <atomic>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace blobstrip {

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------

/// Destination for objects derived during a walk.
class ObjectSink {
public:
    virtual ~ObjectSink() = default;

    /// Persist (or just identify) `obj` and return its id.
    virtual ObjectId write(const Object& obj) = 0;

    /// Distinct objects this sink added to the store.
    virtual size_t objects_written() const = 0;
};

/// Writes through to ObjectStore::put.
class StoreSink : public ObjectSink {
public:
    explicit StoreSink(ObjectStore& store) : store_(store) {}
    ObjectId write(const Object& obj) override;
    size_t   objects_written() const override;

private:
    ObjectStore&        store_;
    mutable std::mutex  mutex_;
    std::set<ObjectId>  written_;
};

/// Computes ids without storing anything (dry run).
class HashSink : public ObjectSink {
public:
    explicit HashSink(const ObjectStore& store) : store_(store) {}
    ObjectId write(const Object& obj) override { return store_.hash(obj); }
    size_t   objects_written() const override { return 0; }

private:
    const ObjectStore& store_;
};

// ---------------------------------------------------------------------------
// GraphWalker
// ---------------------------------------------------------------------------

/// Result of one pass.
struct WalkResult {
    std::vector<ObjectId>     commit_order;      ///< Every reachable commit, parents first.
    std::vector<ObjectId>     rewritten_commits; ///< Old ids whose id changed, same order.
    std::vector<StrippedBlob> stripped_blobs;    ///< Distinct blobs, sorted by id.
    uint64_t                  stripped_bytes = 0;
};

/// Rewrites every commit reachable from a set of tips, oldest first,
/// recording translations in a TranslationTable.
///
/// A commit is visited only after all of its parents. Among commits that
/// are ready at the same time the one with the older committer timestamp
/// goes first, then the smaller id.
class GraphWalker {
public:
    GraphWalker(ObjectStore& store,
                const FilterEngine& filter,
                TranslationTable& table,
                ObjectSink& sink);

    /// Worker threads for independent branches (1 = sequential).
    void set_jobs(unsigned jobs) { jobs_ = jobs == 0 ? 1 : jobs; }

    /// Polled between commits; when it becomes true the walk throws
    /// CancelledError.
    void set_cancel(const std::atomic<bool>* cancel) { cancel_ = cancel; }

    /// Rewrite everything reachable from `tips` and translate the tips
    /// themselves (tags, trees and blobs included).
    /// @throws MissingObjectError, CorruptObjectError, CancelledError
    WalkResult run(const std::vector<ObjectId>& tips);

    /// Commits reachable from `tips` (annotated tags peeled) in the order
    /// run() visits them.
    std::vector<ObjectId> topological_order(const std::vector<ObjectId>& tips);

private:
    struct CommitNode {
        Commit                commit;
        std::vector<ObjectId> children;
    };

    void collect(const std::vector<ObjectId>& tips);
    void walk_sequential(const std::vector<ObjectId>& order);
    void walk_parallel(const std::vector<ObjectId>& order);
    void check_cancel() const;

    ObjectId                rewrite_commit(const ObjectId& id);
    std::optional<ObjectId> rewrite_tree(const ObjectId& id, const std::string& path);
    std::optional<ObjectId> rewrite_blob(const ObjectId& id, const std::string& path);
    ObjectId                rewrite_tip(const ObjectId& id);

    std::string cache_key(const ObjectId& id, const std::string& path) const;

    ObjectStore&              store_;
    const FilterEngine&       filter_;
    TranslationTable&         table_;
    ObjectSink&               sink_;
    unsigned                  jobs_   = 1;
    const std::atomic<bool>*  cancel_ = nullptr;

    std::unordered_map<ObjectId, CommitNode> nodes_;

    /// Tree and blob results keyed by id, or by (path, id) when the policy
    /// is path dependent. An empty value means the entry is dropped.
    TranslationTable entry_cache_;

    std::mutex                                   stripped_mutex_;
    std::unordered_map<ObjectId, StrippedBlob>   stripped_;
};

} // namespace blobstrip
