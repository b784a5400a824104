#include <catch2/catch_test_macros.hpp>
#include "test_helpers.h"

#include <string>

using namespace blobstrip;
using namespace fixtures;

namespace {

/// Three distinct commit ids to point refs at.
struct Tips {
    ObjectId a, b, c;

    explicit Tips(MemoryObjectStore& s) {
        auto t = put_tree(s, {});
        a = put_commit(s, t, {}, 1, "a\n");
        b = put_commit(s, t, {}, 2, "b\n");
        c = put_commit(s, t, {}, 3, "c\n");
    }
};

} // anonymous namespace

TEST_CASE("RefUpdater: backup names live under the namespace", "[refs]") {
    MemoryObjectStore store;
    RefUpdater u(store);
    CHECK(u.backup_name("refs/heads/main") == "refs/backup/heads/main");
    CHECK(u.backup_name("refs/tags/v1") == "refs/backup/tags/v1");
    CHECK(u.is_backup("refs/backup/heads/main"));
    CHECK_FALSE(u.is_backup("refs/heads/backup"));

    RefUpdater custom(store, "refs/original");
    CHECK(custom.backup_namespace() == "refs/original/");
    CHECK(custom.backup_name("refs/heads/dev") == "refs/original/heads/dev");
}

TEST_CASE("RefUpdater: primary refs exclude backups", "[refs]") {
    MemoryObjectStore store;
    Tips t(store);
    store.set_ref("refs/heads/main", t.a);
    store.set_ref("refs/backup/heads/main", t.b);

    auto refs = RefUpdater(store).primary_refs();
    REQUIRE(refs.size() == 1);
    CHECK(refs[0].name == "refs/heads/main");
}

TEST_CASE("RefUpdater: plan translates every ref", "[refs]") {
    MemoryObjectStore store;
    Tips t(store);
    TranslationTable table;
    table.record(t.a, t.c);

    RefUpdater u(store);
    auto plan = u.plan({{"refs/heads/main", t.a}, {"refs/heads/dev", t.b}}, table);
    REQUIRE(plan.size() == 2);
    CHECK(plan[0].moved());
    CHECK(plan[0].new_target == t.c);
    CHECK_FALSE(plan[1].moved());
    CHECK(plan[1].new_target == t.b);
}

TEST_CASE("RefUpdater: apply moves refs and records backups", "[refs]") {
    MemoryObjectStore store;
    Tips t(store);
    store.set_ref("refs/heads/main", t.a);
    store.set_ref("refs/heads/dev", t.b);

    RefUpdater u(store);
    std::vector<RefChange> plan{{"refs/heads/main", t.a, t.c},
                                {"refs/heads/dev", t.b, t.b}};
    auto moved = u.apply(plan, false, "blobstrip: test");

    REQUIRE(moved.size() == 1);
    CHECK(moved[0].ref_name == "refs/heads/main");
    CHECK(store.read_ref("refs/heads/main") == t.c);
    CHECK(store.read_ref("refs/backup/heads/main") == t.a);
    CHECK(store.read_ref("refs/heads/dev") == t.b);
    CHECK_FALSE(store.read_ref("refs/backup/heads/dev").has_value());
    CHECK(store.reflog("refs/heads/main") == std::vector<std::string>{"blobstrip: test"});
}

TEST_CASE("RefUpdater: existing backup blocks a new rewrite", "[refs]") {
    MemoryObjectStore store;
    Tips t(store);
    store.set_ref("refs/heads/main", t.a);
    store.set_ref("refs/backup/heads/main", t.b);

    RefUpdater u(store);
    std::vector<RefChange> plan{{"refs/heads/main", t.a, t.c}};
    CHECK_THROWS_AS(u.check_backups(plan), BackupExistsError);

    // The transaction itself refuses too, unless told to overwrite
    CHECK_THROWS_AS(u.apply(plan, false, "m"), RefConflictError);
    CHECK(store.read_ref("refs/heads/main") == t.a);

    u.apply(plan, true, "m");
    CHECK(store.read_ref("refs/heads/main") == t.c);
    CHECK(store.read_ref("refs/backup/heads/main") == t.a);
}

TEST_CASE("RefUpdater: a concurrent move of an unmoved ref aborts everything", "[refs]") {
    MemoryObjectStore store;
    Tips t(store);
    store.set_ref("refs/heads/main", t.a);
    store.set_ref("refs/heads/dev", t.b);

    RefUpdater u(store);
    TranslationTable table;
    table.record(t.a, t.c);
    auto plan = u.plan(u.primary_refs(), table);

    // Someone else moves dev between planning and applying
    store.set_ref("refs/heads/dev", t.c);

    try {
        u.apply(plan, false, "m");
        FAIL("expected RefConflictError");
    } catch (const RefConflictError& e) {
        CHECK(e.ref_name() == "refs/heads/dev");
    }
    CHECK(store.read_ref("refs/heads/main") == t.a);
    CHECK_FALSE(store.read_ref("refs/backup/heads/main").has_value());
}

TEST_CASE("RefUpdater: a concurrent move of a moved ref aborts everything", "[refs]") {
    MemoryObjectStore store;
    Tips t(store);
    store.set_ref("refs/heads/main", t.a);
    store.set_ref("refs/heads/dev", t.a);

    RefUpdater u(store);
    TranslationTable table;
    table.record(t.a, t.c);
    auto plan = u.plan(u.primary_refs(), table);

    store.set_ref("refs/heads/main", t.b);

    CHECK_THROWS_AS(u.apply(plan, false, "m"), RefConflictError);
    CHECK(store.read_ref("refs/heads/main") == t.b);
    CHECK(store.read_ref("refs/heads/dev") == t.a);
    CHECK_FALSE(store.read_ref("refs/backup/heads/dev").has_value());
}

TEST_CASE("RefUpdater: rollback restores refs and removes backups", "[refs]") {
    MemoryObjectStore store;
    Tips t(store);
    store.set_ref("refs/heads/main", t.a);

    RefUpdater u(store);
    auto moved = u.apply({{"refs/heads/main", t.a, t.c}}, false, "rewrite");
    auto report = u.rollback(moved, "rollback");

    REQUIRE(report.restored.size() == 1);
    CHECK(report.restored[0].new_target == t.a);
    CHECK(store.read_ref("refs/heads/main") == t.a);
    CHECK_FALSE(store.read_ref("refs/backup/heads/main").has_value());
}

TEST_CASE("RefUpdater: rollback refuses if the ref moved since", "[refs]") {
    MemoryObjectStore store;
    Tips t(store);
    store.set_ref("refs/heads/main", t.a);

    RefUpdater u(store);
    auto moved = u.apply({{"refs/heads/main", t.a, t.c}}, false, "rewrite");
    store.set_ref("refs/heads/main", t.b);

    CHECK_THROWS_AS(u.rollback(moved, "rollback"), RefConflictError);
    CHECK(store.read_ref("refs/heads/main") == t.b);
    CHECK(store.read_ref("refs/backup/heads/main") == t.a);
}

TEST_CASE("ObjectStore: update_ref is a compare-and-swap", "[refs]") {
    MemoryObjectStore store;
    Tips t(store);
    store.set_ref("refs/heads/main", t.a);

    store.update_ref("refs/heads/main", t.a, t.b);
    CHECK(store.read_ref("refs/heads/main") == t.b);
    CHECK_THROWS_AS(store.update_ref("refs/heads/main", t.a, t.c), RefConflictError);
    CHECK(store.read_ref("refs/heads/main") == t.b);
}

TEST_CASE("ObjectStore: invalid ref names are rejected", "[refs]") {
    MemoryObjectStore store;
    Tips t(store);
    for (const char* bad : {"refs/heads/a..b", "refs/heads/x.lock", "refs/heads/",
                            "refs//heads", "refs/heads/a b", "refs/heads/@{1}"}) {
        CHECK_THROWS_AS(store.apply_ref_transaction(
                            {RefUpdate{bad, std::nullopt, t.a, false}}, "m"),
                        InvalidRefNameError);
    }
}
