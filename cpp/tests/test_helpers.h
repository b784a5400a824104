#pragma once

// Shared fixtures for building small object graphs in tests.

#include <blobstrip/blobstrip.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace fixtures {

using namespace blobstrip;

inline std::string signature(int64_t time) {
    return "A U Thor <author@example.com> " + std::to_string(time) + " +0000";
}

inline ObjectId put_blob(ObjectStore& s, const std::string& content) {
    return s.put(Object::blob(content));
}

/// Blob of exactly `size` bytes, distinguished by `fill`.
inline ObjectId put_sized_blob(ObjectStore& s, size_t size, char fill = 'x') {
    return s.put(Object::blob(std::string(size, fill)));
}

inline TreeEntry file(const std::string& name, const ObjectId& id) {
    return TreeEntry{name, MODE_BLOB, id};
}

inline TreeEntry dir(const std::string& name, const ObjectId& id) {
    return TreeEntry{name, MODE_TREE, id};
}

inline ObjectId put_tree(ObjectStore& s, std::vector<TreeEntry> entries) {
    sort_tree_entries(entries);
    return s.put(encode_tree(Tree{std::move(entries)}));
}

inline ObjectId put_commit(ObjectStore& s, const ObjectId& tree,
                           std::vector<ObjectId> parents, int64_t time,
                           const std::string& message = "commit\n") {
    Commit c;
    c.tree      = tree;
    c.parents   = std::move(parents);
    c.author    = signature(time);
    c.committer = signature(time);
    c.message   = message;
    return s.put(encode_commit(c));
}

inline Commit read_commit(ObjectStore& s, const ObjectId& id) {
    return decode_commit(s.get(id), id);
}

inline Tree read_tree(ObjectStore& s, const ObjectId& id) {
    return decode_tree(s.get(id), id);
}

/// Id of the entry `name` in tree `tree_id`, or "" if absent.
inline ObjectId entry_id(ObjectStore& s, const ObjectId& tree_id, const std::string& name) {
    for (auto& e : read_tree(s, tree_id).entries) {
        if (e.name == name) return e.id;
    }
    return {};
}

/// Every blob reachable from `roots`.
inline std::unordered_set<ObjectId> reachable_blobs(ObjectStore& s,
                                                    const std::vector<ObjectId>& roots) {
    std::unordered_set<ObjectId> out;
    GarbageCollector gc(s);
    for (auto& id : gc.mark(roots)) {
        if (s.stat(id).kind == ObjectKind::Blob) out.insert(id);
    }
    return out;
}

/// Unique temporary path that does not exist yet.
inline std::filesystem::path make_temp_repo() {
    auto tmp = std::filesystem::temp_directory_path() /
               ("blobstrip_test_" + std::to_string(
                    std::hash<std::thread::id>{}(std::this_thread::get_id())
                    ^ static_cast<size_t>(
                          std::chrono::steady_clock::now()
                              .time_since_epoch()
                              .count())));
    return tmp;
}

/// The kilobyte-scaled three-commit history:
/// C1 (a.bin 10K) -> C2 (adds b.bin 150K) -> C3 (b.bin becomes 50K).
struct ThreeCommitHistory {
    ObjectId a, b_big, b_small;
    ObjectId c1, c2, c3;

    explicit ThreeCommitHistory(ObjectStore& s) {
        a       = put_sized_blob(s, 10 * 1024, 'a');
        b_big   = put_sized_blob(s, 150 * 1024, 'B');
        b_small = put_sized_blob(s, 50 * 1024, 'b');
        c1 = put_commit(s, put_tree(s, {file("a.bin", a)}), {}, 1000, "C1\n");
        c2 = put_commit(s, put_tree(s, {file("a.bin", a), file("b.bin", b_big)}),
                        {c1}, 2000, "C2\n");
        c3 = put_commit(s, put_tree(s, {file("a.bin", a), file("b.bin", b_small)}),
                        {c2}, 3000, "C3\n");
    }
};

inline Policy threshold_policy(int64_t bytes) {
    Policy p;
    p.size_threshold_bytes = bytes;
    return p;
}

} // namespace fixtures
