#include <catch2/catch_test_macros.hpp>
#include "test_helpers.h"

#include <git2.h>

#include <filesystem>
#include <string>

using namespace blobstrip;
using namespace fixtures;

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static GitObjectStore open_store(const fs::path& path) {
    OpenOptions opts;
    opts.create = true;
    return GitObjectStore::open(path, opts);
}

static void create_ref(ObjectStore& store, const std::string& name, const ObjectId& target) {
    store.apply_ref_transaction({RefUpdate{name, std::nullopt, target, false}}, "test: create");
}

static bool loose_exists(const GitObjectStore& store, const ObjectId& id) {
    return fs::exists(store.gitdir() / "objects" / id.substr(0, 2) / id.substr(2));
}

static size_t pack_count(const GitObjectStore& store) {
    size_t n = 0;
    auto dir = store.gitdir() / "objects" / "pack";
    if (!fs::exists(dir)) return 0;
    for (auto& e : fs::directory_iterator(dir)) {
        if (e.path().extension() == ".pack") ++n;
    }
    return n;
}

/// Move every object into one pack and delete the loose copies, the way
/// `git gc` leaves a repository.
static void pack_everything(GitObjectStore& store) {
    auto inner = store.inner();
    git_packbuilder* pb = nullptr;
    REQUIRE(git_packbuilder_new(&pb, inner->repo) == 0);
    for (auto& id : store.list_objects()) {
        git_oid oid;
        REQUIRE(git_oid_fromstr(&oid, id.c_str()) == 0);
        REQUIRE(git_packbuilder_insert(pb, &oid, nullptr) == 0);
    }
    auto pack_dir = store.gitdir() / "objects" / "pack";
    fs::create_directories(pack_dir);
    REQUIRE(git_packbuilder_write(pb, pack_dir.string().c_str(), 0, nullptr, nullptr) == 0);
    git_packbuilder_free(pb);

    for (auto& e : fs::directory_iterator(store.gitdir() / "objects")) {
        if (e.is_directory() && e.path().filename().string().size() == 2) {
            fs::remove_all(e.path());
        }
    }
    inner->reopen();
}

// ---------------------------------------------------------------------------
// Opening
// ---------------------------------------------------------------------------

TEST_CASE("GitObjectStore: create and reopen a bare repository", "[gitstore]") {
    auto path = make_temp_repo();
    REQUIRE_FALSE(fs::exists(path));

    {
        auto store = open_store(path);
        CHECK(store.path() == path);
        CHECK(fs::exists(store.gitdir() / "objects"));
    }
    {
        auto store = GitObjectStore::open(path);
        CHECK(store.iterate_refs().empty());
    }

    fs::remove_all(path);
}

TEST_CASE("GitObjectStore: missing repository is unavailable", "[gitstore]") {
    auto path = make_temp_repo();
    CHECK_THROWS_AS(GitObjectStore::open(path), StoreUnavailableError);
}

// ---------------------------------------------------------------------------
// Objects
// ---------------------------------------------------------------------------

TEST_CASE("GitObjectStore: objects round-trip with git ids", "[gitstore]") {
    auto path = make_temp_repo();
    {
        auto store = open_store(path);
        auto id = put_blob(store, "hello\n");
        CHECK(id == "ce013625030ba8dba906f756967f9e9ca394464a");
        CHECK(store.contains(id));
        CHECK(loose_exists(store, id));

        Object back = store.get(id);
        CHECK(back.kind == ObjectKind::Blob);
        CHECK(std::string(back.data.begin(), back.data.end()) == "hello\n");

        ObjectHeader h = store.stat(id);
        CHECK(h.kind == ObjectKind::Blob);
        CHECK(h.size == 6);

        auto tree = put_tree(store, {file("hello.txt", id)});
        auto commit = put_commit(store, tree, {}, 1700000000, "first\n");
        CHECK(commit == hash_object(store.get(commit)));
        CHECK(read_commit(store, commit).tree == tree);

        const ObjectId ghost = "3333333333333333333333333333333333333333";
        CHECK_FALSE(store.contains(ghost));
        CHECK_THROWS_AS(store.get(ghost), MissingObjectError);
        CHECK_THROWS_AS(store.stat(ghost), MissingObjectError);
        CHECK_THROWS_AS(store.get("not-an-id"), InvalidHashError);
    }
    fs::remove_all(path);
}

// ---------------------------------------------------------------------------
// Refs
// ---------------------------------------------------------------------------

TEST_CASE("GitObjectStore: ref transactions are compare-and-swap", "[gitstore]") {
    auto path = make_temp_repo();
    {
        auto store = open_store(path);
        ThreeCommitHistory h(store);

        create_ref(store, "refs/heads/main", h.c1);
        create_ref(store, "refs/heads/dev", h.c2);
        auto refs = store.iterate_refs();
        REQUIRE(refs.size() == 2);
        CHECK(refs[0].name == "refs/heads/dev");
        CHECK(refs[1].name == "refs/heads/main");

        store.update_ref("refs/heads/main", h.c1, h.c3);
        CHECK(store.read_ref("refs/heads/main") == h.c3);

        // A stale expectation on one ref aborts the whole batch
        std::vector<RefUpdate> batch{
            RefUpdate{"refs/heads/dev", h.c2, h.c3, false},
            RefUpdate{"refs/heads/main", h.c1, h.c2, false},
        };
        CHECK_THROWS_AS(store.apply_ref_transaction(batch, "m"), RefConflictError);
        CHECK(store.read_ref("refs/heads/dev") == h.c2);
        CHECK(store.read_ref("refs/heads/main") == h.c3);

        // Creating an existing ref conflicts, deleting works
        CHECK_THROWS_AS(create_ref(store, "refs/heads/dev", h.c1), RefConflictError);
        store.apply_ref_transaction({RefUpdate{"refs/heads/dev", h.c2, std::nullopt, false}},
                                    "m");
        CHECK_FALSE(store.read_ref("refs/heads/dev").has_value());
    }
    fs::remove_all(path);
}

TEST_CASE("GitObjectStore: journal lives beside the repository", "[gitstore]") {
    auto path = make_temp_repo();
    {
        auto store = open_store(path);
        CHECK_FALSE(store.read_journal().has_value());
        store.write_journal("{\"x\": 1}\n");
        CHECK(fs::exists(store.gitdir() / "blobstrip-journal.json"));
        CHECK(store.read_journal() == std::string("{\"x\": 1}\n"));
        CHECK(store.clear_journal());
        CHECK_FALSE(store.clear_journal());
    }
    fs::remove_all(path);
}

#ifndef _WIN32
TEST_CASE("GitObjectStore: the writer lock is exclusive", "[gitstore]") {
    auto path = make_temp_repo();
    {
        auto store = open_store(path);
        auto held = store.lock(LockMode::Try, std::chrono::milliseconds(0));
        CHECK_THROWS_AS(store.lock(LockMode::Try, std::chrono::milliseconds(0)),
                        StoreUnavailableError);
        CHECK_THROWS_AS(store.lock(LockMode::Wait, std::chrono::milliseconds(120)),
                        StoreUnavailableError);
        held.reset();
        CHECK_NOTHROW(store.lock(LockMode::Try, std::chrono::milliseconds(0)));
    }
    fs::remove_all(path);
}
#endif

// ---------------------------------------------------------------------------
// Rewrite, rollback and gc end to end
// ---------------------------------------------------------------------------

TEST_CASE("GitObjectStore: rewrite then gc reclaims loose objects", "[gitstore]") {
    auto path = make_temp_repo();
    {
        auto store = open_store(path);
        ThreeCommitHistory h(store);
        create_ref(store, "refs/heads/main", h.c3);

        HistoryRewriter rewriter(store);
        auto report = rewriter.rewrite(threshold_policy(100 * 1024));
        CHECK(report.stripped_blob_count == 1);
        CHECK(store.read_ref("refs/backup/heads/main") == h.c3);
        CHECK(fs::exists(store.gitdir() / "blobstrip-journal.json"));

        GcOptions gc;
        gc.confirm = true;
        auto first = rewriter.collect_garbage(gc);
        CHECK(first.performed_work());
        CHECK_FALSE(store.contains(h.b_big));
        CHECK_FALSE(loose_exists(store, h.b_big));
        CHECK(store.contains(h.b_small));
        CHECK_FALSE(store.read_ref("refs/backup/heads/main").has_value());
        CHECK_FALSE(fs::exists(store.gitdir() / "blobstrip-journal.json"));

        auto second = rewriter.collect_garbage(gc);
        CHECK_FALSE(second.performed_work());
    }
    fs::remove_all(path);
}

TEST_CASE("GitObjectStore: gc rewrites packs without unreachable objects", "[gitstore]") {
    auto path = make_temp_repo();
    {
        auto store = open_store(path);
        ThreeCommitHistory h(store);
        create_ref(store, "refs/heads/main", h.c3);
        pack_everything(store);
        REQUIRE(pack_count(store) == 1);
        REQUIRE_FALSE(loose_exists(store, h.b_big));
        REQUIRE(store.contains(h.b_big));

        HistoryRewriter rewriter(store);
        rewriter.rewrite(threshold_policy(100 * 1024));
        GcOptions gc;
        gc.confirm = true;
        auto report = rewriter.collect_garbage(gc);

        CHECK(report.objects_removed > 0);
        CHECK_FALSE(store.contains(h.b_big));
        CHECK(store.contains(h.a));
        CHECK(store.contains(h.c1));
        CHECK(pack_count(store) == 1);

        auto main = store.read_ref("refs/heads/main");
        REQUIRE(main.has_value());
        CHECK(read_commit(store, *main).message == "C3\n");
    }
    fs::remove_all(path);
}

TEST_CASE("GitObjectStore: gc removes objects that are both loose and packed", "[gitstore]") {
    auto path = make_temp_repo();
    {
        auto store = open_store(path);
        ThreeCommitHistory h(store);
        create_ref(store, "refs/heads/main", h.c3);
        pack_everything(store);

        HistoryRewriter rewriter(store);
        rewriter.rewrite(threshold_policy(100 * 1024));
        GcOptions gc;
        gc.confirm = true;
        rewriter.collect_garbage(gc);

        auto rewritten = store.read_ref("refs/heads/main");
        REQUIRE(rewritten.has_value());
        REQUIRE(*rewritten != h.c3);
        CHECK_FALSE(loose_exists(store, *rewritten));

        // Rewritten history becomes unreachable again
        store.update_ref("refs/heads/main", *rewritten, h.c1);
        auto second = rewriter.collect_garbage(gc);
        CHECK(second.performed_work());
        CHECK_FALSE(store.contains(*rewritten));
        CHECK(store.contains(h.c1));
        CHECK(store.contains(h.a));

        auto third = rewriter.collect_garbage(gc);
        CHECK_FALSE(third.performed_work());
    }
    fs::remove_all(path);
}

TEST_CASE("GitObjectStore: rollback restores the branch", "[gitstore]") {
    auto path = make_temp_repo();
    {
        auto store = open_store(path);
        ThreeCommitHistory h(store);
        create_ref(store, "refs/heads/main", h.c3);

        HistoryRewriter rewriter(store);
        rewriter.rewrite(threshold_policy(100 * 1024));
        REQUIRE(store.read_ref("refs/heads/main") != h.c3);

        auto report = rewriter.rollback();
        CHECK(report.restored.size() == 1);
        CHECK(store.read_ref("refs/heads/main") == h.c3);
        CHECK_FALSE(store.read_ref("refs/backup/heads/main").has_value());
        CHECK_THROWS_AS(rewriter.rollback(), NothingToRollBackError);
    }
    fs::remove_all(path);
}

TEST_CASE("GitObjectStore: verify writes nothing to the repository", "[gitstore]") {
    auto path = make_temp_repo();
    {
        auto store = open_store(path);
        ThreeCommitHistory h(store);
        create_ref(store, "refs/heads/main", h.c3);
        auto before = store.list_objects().size();

        auto report = HistoryRewriter(store).verify(threshold_policy(100 * 1024));
        CHECK(report.code == ResultCode::SuccessDryRun);
        CHECK(report.stripped_blob_count == 1);
        CHECK(store.list_objects().size() == before);
        CHECK(store.read_ref("refs/heads/main") == h.c3);
    }
    fs::remove_all(path);
}

TEST_CASE("GitObjectStore: gc keeps history reachable from a detached HEAD", "[gitstore]") {
    auto path = make_temp_repo();
    {
        auto store = open_store(path);
        ThreeCommitHistory h(store);
        create_ref(store, "refs/heads/main", h.c1);

        git_oid oid;
        REQUIRE(git_oid_fromstr(&oid, h.c3.c_str()) == 0);
        REQUIRE(git_repository_set_head_detached(store.inner()->repo, &oid) == 0);

        GcOptions gc;
        gc.confirm = true;
        HistoryRewriter(store).collect_garbage(gc);
        CHECK(store.contains(h.c3));
        CHECK(store.contains(h.b_big));
        CHECK(store.read_ref("HEAD") == h.c3);
    }
    fs::remove_all(path);
}
