#include <catch2/catch_test_macros.hpp>
#include <blobstrip/translation_table.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace blobstrip;

TEST_CASE("TranslationTable: first record wins", "[table]") {
    TranslationTable t;
    CHECK(t.record("old", "new1") == "new1");
    CHECK(t.record("old", "new2") == "new1");
    CHECK(t.at("old") == "new1");
    CHECK(t.size() == 1);
}

TEST_CASE("TranslationTable: identity entries are not counted as changes", "[table]") {
    TranslationTable t;
    t.record("a", "a");
    t.record("b", "c");
    CHECK(t.size() == 2);
    CHECK(t.changed_count() == 1);
}

TEST_CASE("TranslationTable: translate falls back to identity", "[table]") {
    TranslationTable t;
    t.record("a", "b");
    CHECK(t.translate("a") == "b");
    CHECK(t.translate("z") == "z");
    CHECK_FALSE(t.lookup("z").has_value());
    CHECK_FALSE(t.contains("z"));
    CHECK_THROWS_AS(t.at("z"), BlobstripError);
}

TEST_CASE("TranslationTable: snapshot is sorted", "[table]") {
    TranslationTable t;
    t.record("c", "3");
    t.record("a", "1");
    t.record("b", "2");
    auto snap = t.snapshot();
    REQUIRE(snap.size() == 3);
    CHECK(snap.begin()->first == "a");
    CHECK(snap.rbegin()->first == "c");
}

TEST_CASE("TranslationTable: concurrent writers agree on one value per id", "[table]") {
    TranslationTable t;
    constexpr int kThreads = 8;
    constexpr int kIds = 500;

    std::atomic<bool> go{false};
    std::vector<std::vector<std::string>> seen(kThreads);
    std::vector<std::thread> threads;
    for (int w = 0; w < kThreads; ++w) {
        threads.emplace_back([&, w]() {
            while (!go.load()) std::this_thread::yield();
            for (int i = 0; i < kIds; ++i) {
                seen[w].push_back(t.record("id" + std::to_string(i),
                                           "w" + std::to_string(w)));
            }
        });
    }
    go.store(true);
    for (auto& th : threads) th.join();

    CHECK(t.size() == static_cast<size_t>(kIds));
    for (int i = 0; i < kIds; ++i) {
        auto winner = t.at("id" + std::to_string(i));
        for (int w = 0; w < kThreads; ++w) CHECK(seen[w][i] == winner);
    }
}
