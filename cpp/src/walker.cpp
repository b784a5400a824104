#include "blobstrip/walker.h"
#include "blobstrip/log.h"
#include "blobstrip/object.h"
#include "internal.h"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <functional>
#include <queue>
#include <thread>
#include <unordered_set>

namespace blobstrip {

// ---------------------------------------------------------------------------
// StoreSink
// ---------------------------------------------------------------------------

ObjectId StoreSink::write(const Object& obj) {
    ObjectId id = store_.hash(obj);
    if (store_.contains(id)) return id;
    store_.put(obj);
    std::lock_guard<std::mutex> lk(mutex_);
    written_.insert(id);
    return id;
}

size_t StoreSink::objects_written() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return written_.size();
}

// ---------------------------------------------------------------------------
// GraphWalker
// ---------------------------------------------------------------------------

GraphWalker::GraphWalker(ObjectStore& store,
                         const FilterEngine& filter,
                         TranslationTable& table,
                         ObjectSink& sink)
    : store_(store), filter_(filter), table_(table), sink_(sink) {}

std::string GraphWalker::cache_key(const ObjectId& id, const std::string& path) const {
    if (!filter_.path_dependent()) return id;
    std::string key = path;
    key += '\0';
    key += id;
    return key;
}

void GraphWalker::check_cancel() const {
    if (cancel_ && cancel_->load()) throw CancelledError();
}

void GraphWalker::collect(const std::vector<ObjectId>& tips) {
    nodes_.clear();

    std::vector<ObjectId> stack;
    for (auto& tip : tips) {
        // Peel annotated tags down to whatever they finally name
        ObjectId id = tip;
        ObjectKind kind = store_.stat(id).kind;
        while (kind == ObjectKind::Tag) {
            id = decode_tag(store_.get(id), id).object;
            kind = store_.stat(id).kind;
        }
        if (kind == ObjectKind::Commit) stack.push_back(id);
    }

    while (!stack.empty()) {
        ObjectId id = std::move(stack.back());
        stack.pop_back();
        if (nodes_.count(id)) continue;

        Commit commit = decode_commit(store_.get(id), id);
        for (auto& p : commit.parents) {
            if (!nodes_.count(p)) stack.push_back(p);
        }
        nodes_.emplace(id, CommitNode{std::move(commit), {}});
    }

    for (auto& [id, node] : nodes_) {
        for (auto& p : node.commit.parents) nodes_.at(p).children.push_back(id);
    }
}

std::vector<ObjectId> GraphWalker::topological_order(const std::vector<ObjectId>& tips) {
    collect(tips);

    // Older committer time first, then smaller id
    auto later = [this](const ObjectId& a, const ObjectId& b) {
        int64_t ta = nodes_.at(a).commit.time();
        int64_t tb = nodes_.at(b).commit.time();
        if (ta != tb) return ta > tb;
        return a > b;
    };
    std::priority_queue<ObjectId, std::vector<ObjectId>, decltype(later)> ready(later);

    std::unordered_map<ObjectId, size_t> pending;
    for (auto& [id, node] : nodes_) {
        pending[id] = node.commit.parents.size();
        if (node.commit.parents.empty()) ready.push(id);
    }

    std::vector<ObjectId> order;
    order.reserve(nodes_.size());
    while (!ready.empty()) {
        ObjectId id = ready.top();
        ready.pop();
        for (auto& child : nodes_.at(id).children) {
            if (--pending[child] == 0) ready.push(child);
        }
        order.push_back(std::move(id));
    }

    if (order.size() != nodes_.size()) {
        throw CorruptObjectError(tips.empty() ? std::string() : tips.front(),
                                 "commit graph contains a cycle");
    }
    return order;
}

WalkResult GraphWalker::run(const std::vector<ObjectId>& tips) {
    {
        std::lock_guard<std::mutex> lk(stripped_mutex_);
        stripped_.clear();
    }

    WalkResult result;
    result.commit_order = topological_order(tips);
    BLOBSTRIP_LOG_DEBUG("walking {} commits from {} tips with {} job(s)",
                        result.commit_order.size(), tips.size(), jobs_);

    if (jobs_ > 1 && result.commit_order.size() > 1) {
        walk_parallel(result.commit_order);
    } else {
        walk_sequential(result.commit_order);
    }

    for (auto& tip : tips) {
        check_cancel();
        rewrite_tip(tip);
    }

    for (auto& id : result.commit_order) {
        if (table_.at(id) != id) result.rewritten_commits.push_back(id);
    }

    {
        std::lock_guard<std::mutex> lk(stripped_mutex_);
        for (auto& [id, blob] : stripped_) {
            result.stripped_blobs.push_back(blob);
            result.stripped_bytes += blob.size;
        }
    }
    std::sort(result.stripped_blobs.begin(), result.stripped_blobs.end(),
              [](const StrippedBlob& a, const StrippedBlob& b) { return a.id < b.id; });

    BLOBSTRIP_LOG_INFO("walked {} commits: {} rewritten, {} blobs stripped ({} bytes)",
                       result.commit_order.size(), result.rewritten_commits.size(),
                       result.stripped_blobs.size(), result.stripped_bytes);
    return result;
}

void GraphWalker::walk_sequential(const std::vector<ObjectId>& order) {
    for (auto& id : order) {
        check_cancel();
        rewrite_commit(id);
    }
}

void GraphWalker::walk_parallel(const std::vector<ObjectId>& order) {
    // Same (time, id) priority as topological_order(), so sequential and
    // parallel walks hand out commits in a comparable order
    auto later = [this](const ObjectId& a, const ObjectId& b) {
        int64_t ta = nodes_.at(a).commit.time();
        int64_t tb = nodes_.at(b).commit.time();
        if (ta != tb) return ta > tb;
        return a > b;
    };
    std::priority_queue<ObjectId, std::vector<ObjectId>, decltype(later)> ready(later);

    std::unordered_map<ObjectId, size_t> pending;
    for (auto& id : order) {
        size_t n = nodes_.at(id).commit.parents.size();
        pending[id] = n;
        if (n == 0) ready.push(id);
    }

    std::mutex              m;
    std::condition_variable cv;
    size_t                  done = 0;
    std::exception_ptr      error;

    auto worker = [&]() {
        std::unique_lock<std::mutex> lk(m);
        for (;;) {
            cv.wait(lk, [&] { return error || !ready.empty() || done == order.size(); });
            if (error || done == order.size()) return;

            ObjectId id = ready.top();
            ready.pop();
            lk.unlock();
            try {
                check_cancel();
                rewrite_commit(id);
            } catch (...) {
                lk.lock();
                if (!error) error = std::current_exception();
                cv.notify_all();
                return;
            }
            lk.lock();

            ++done;
            for (auto& child : nodes_.at(id).children) {
                if (--pending[child] == 0) ready.push(child);
            }
            cv.notify_all();
        }
    };

    unsigned n = std::min<size_t>(jobs_, order.size());
    std::vector<std::thread> threads;
    threads.reserve(n);
    for (unsigned i = 0; i < n; ++i) threads.emplace_back(worker);
    for (auto& t : threads) t.join();

    if (error) std::rethrow_exception(error);
}

// ---------------------------------------------------------------------------
// Per-object rewriting
// ---------------------------------------------------------------------------

ObjectId GraphWalker::rewrite_commit(const ObjectId& id) {
    const Commit& old = nodes_.at(id).commit;

    auto tree = rewrite_tree(old.tree, "");
    ObjectId new_tree = tree ? *tree : sink_.write(encode_tree(Tree{}));

    bool changed = new_tree != old.tree;
    std::vector<ObjectId> parents;
    parents.reserve(old.parents.size());
    for (auto& p : old.parents) {
        parents.push_back(table_.at(p));
        if (parents.back() != p) changed = true;
    }

    if (!changed) return table_.record(id, id);

    Commit rewritten = old;
    rewritten.tree    = new_tree;
    rewritten.parents = std::move(parents);
    ObjectId new_id = sink_.write(encode_commit(rewritten));
    BLOBSTRIP_LOG_DEBUG("commit {} -> {}", id, new_id);
    return table_.record(id, new_id);
}

std::optional<ObjectId> GraphWalker::rewrite_tree(const ObjectId& id, const std::string& path) {
    std::string key = cache_key(id, path);
    if (auto cached = entry_cache_.lookup(key)) {
        if (cached->empty()) return std::nullopt;
        return *cached;
    }

    Tree tree = decode_tree(store_.get(id), id);
    Tree rebuilt;
    rebuilt.entries.reserve(tree.entries.size());
    bool changed = false;

    for (auto& e : tree.entries) {
        std::string child = paths::join(path, e.name);
        std::optional<ObjectId> next;
        if (e.is_gitlink()) {
            next = e.id;
        } else if (e.is_tree()) {
            next = rewrite_tree(e.id, child);
        } else {
            next = rewrite_blob(e.id, child);
        }

        if (!next) {
            changed = true;
            continue;
        }
        if (*next != e.id) changed = true;
        rebuilt.entries.push_back(TreeEntry{e.name, e.mode, *next});
    }

    std::optional<ObjectId> result = id;
    if (changed) {
        if (rebuilt.entries.empty() && filter_.policy().strip_mode == StripMode::Drop) {
            result = std::nullopt;
        } else {
            result = sink_.write(encode_tree(rebuilt));
        }
    }

    if (result && !filter_.path_dependent()) table_.record(id, *result);
    ObjectId stored = entry_cache_.record(key, result.value_or(std::string()));
    if (stored.empty()) return std::nullopt;
    return stored;
}

std::optional<ObjectId> GraphWalker::rewrite_blob(const ObjectId& id, const std::string& path) {
    std::string key = cache_key(id, path);
    if (auto cached = entry_cache_.lookup(key)) {
        if (cached->empty()) return std::nullopt;
        return *cached;
    }

    ObjectHeader header = store_.stat(id);
    if (header.kind != ObjectKind::Blob) {
        throw CorruptObjectError(id, std::string("expected blob at ") + path +
                                     ", found " + kind_name(header.kind));
    }

    Classification c = filter_.classify(id, header.size, path, [&]() {
        return store_.get(id).data;
    });

    std::optional<ObjectId> result = id;
    if (c.strip()) {
        result = c.replacement ? std::optional<ObjectId>(sink_.write(*c.replacement))
                               : std::nullopt;
        if (result) table_.record(id, *result);

        std::lock_guard<std::mutex> lk(stripped_mutex_);
        stripped_.emplace(id, StrippedBlob{id, header.size, path, result});
    }

    ObjectId stored = entry_cache_.record(key, result.value_or(std::string()));
    if (stored.empty()) return std::nullopt;
    return stored;
}

ObjectId GraphWalker::rewrite_tip(const ObjectId& id) {
    if (auto known = table_.lookup(id)) return *known;

    ObjectId new_id = id;
    switch (store_.stat(id).kind) {
        case ObjectKind::Commit:
            new_id = table_.at(id);
            break;
        case ObjectKind::Tag: {
            Tag tag = decode_tag(store_.get(id), id);
            ObjectId target = rewrite_tip(tag.object);
            if (target != tag.object) {
                tag.object = target;
                new_id = sink_.write(encode_tag(tag));
                BLOBSTRIP_LOG_DEBUG("tag {} ({}) -> {}", tag.name, id, new_id);
            }
            break;
        }
        case ObjectKind::Tree: {
            auto tree = rewrite_tree(id, "");
            new_id = tree ? *tree : sink_.write(encode_tree(Tree{}));
            break;
        }
        case ObjectKind::Blob: {
            auto blob = rewrite_blob(id, "");
            new_id = blob ? *blob : sink_.write(Object::blob(std::vector<uint8_t>{}));
            break;
        }
    }
    return table_.record(id, new_id);
}

} // namespace blobstrip
