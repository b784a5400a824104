#include <catch2/catch_test_macros.hpp>
#include <blobstrip/json.h>

#include <string>

using namespace blobstrip;
using json = nlohmann::json;

TEST_CASE("parse_size understands binary suffixes", "[json]") {
    CHECK(parse_size("150") == 150);
    CHECK(parse_size("100K") == 100 * 1024);
    CHECK(parse_size("100M") == 100LL * 1024 * 1024);
    CHECK(parse_size("2G") == 2LL * 1024 * 1024 * 1024);
    CHECK(parse_size("100MB") == 100LL * 1024 * 1024);
    CHECK(parse_size("1KiB") == 1024);
    CHECK(parse_size("5m") == 5LL * 1024 * 1024);

    CHECK_THROWS_AS(parse_size(""), PolicyInvalidError);
    CHECK_THROWS_AS(parse_size("abc"), PolicyInvalidError);
    CHECK_THROWS_AS(parse_size("10X"), PolicyInvalidError);
    CHECK_THROWS_AS(parse_size("99999999999999999999"), PolicyInvalidError);
}

TEST_CASE("policy_from_json reads a full document", "[json]") {
    auto p = policy_from_json(json::parse(R"({
        "size_threshold_bytes": "100M",
        "path_patterns": ["*.bin", "assets/**"],
        "strip_mode": "drop"
    })"));
    CHECK(p.size_threshold_bytes == 100LL * 1024 * 1024);
    REQUIRE(p.path_patterns.has_value());
    CHECK(p.path_patterns->size() == 2);
    CHECK(p.strip_mode == StripMode::Drop);

    json back = p;
    CHECK(back["strip_mode"] == "drop");
    CHECK(back["size_threshold_bytes"] == 100LL * 1024 * 1024);
}

TEST_CASE("policy_from_json rejects bad documents", "[json]") {
    CHECK_THROWS_AS(policy_from_json(json::parse("[]")), PolicyInvalidError);
    CHECK_THROWS_AS(policy_from_json(json::parse(R"({})")), PolicyInvalidError);
    CHECK_THROWS_AS(policy_from_json(json::parse(R"({"size_threshold_bytes": 0})")),
                    PolicyInvalidError);
    CHECK_THROWS_AS(policy_from_json(json::parse(
                        R"({"size_threshold_bytes": 10, "strip_mode": "burn"})")),
                    PolicyInvalidError);
    CHECK_THROWS_AS(policy_from_json(json::parse(
                        R"({"size_threshold_bytes": 10, "path_patterns": "*.bin"})")),
                    PolicyInvalidError);
    CHECK_THROWS_AS(policy_from_json(json::parse(
                        R"({"size_threshold_bytes": 10, "threshold": 5})")),
                    PolicyInvalidError);
    CHECK_THROWS_AS(policy_from_json(json::parse(
                        R"({"size_threshold_bytes": 10, "path_patterns": ["a//b"]})")),
                    PolicyInvalidError);
}

TEST_CASE("rewrite report serializes every field", "[json]") {
    RewriteReport r;
    r.code = ResultCode::SuccessDryRun;
    r.dry_run = true;
    r.stripped_blob_count = 1;
    r.bytes_reclaimed_estimate = 4096;
    r.affected_ref_names = {"refs/heads/main"};
    r.ref_changes = {{"refs/heads/main", "a", "b"}};
    r.stripped_blobs = {{"x", 4096, "big.bin", std::nullopt}};

    json j = r;
    CHECK(j["code"] == "success_dry_run");
    CHECK(j["dry_run"] == true);
    CHECK(j["offending_blob_count"] == 1);
    CHECK(j["offending_total_bytes"] == 4096);
    CHECK(j["ref_changes"][0]["ref"] == "refs/heads/main");
    CHECK(j["stripped_blobs"][0]["replacement"].is_null());
    CHECK(j["affected_commit_ids"].is_array());
}

TEST_CASE("gc report carries performed_work", "[json]") {
    GcReport g;
    json quiet = g;
    CHECK(quiet["performed_work"] == false);

    g.objects_removed = 3;
    json busy = g;
    CHECK(busy["performed_work"] == true);
}

TEST_CASE("journal round-trips and rejects garbage", "[json]") {
    RewriteJournal j;
    j.backup_namespace = "refs/backup/";
    j.changes = {{"refs/heads/main", "old", "new"}, {"refs/tags/v1", "t0", "t1"}};

    RewriteJournal back = decode_journal(encode_journal(j));
    CHECK(back.backup_namespace == "refs/backup/");
    REQUIRE(back.changes.size() == 2);
    CHECK(back.changes[1].ref_name == "refs/tags/v1");
    CHECK(back.changes[1].new_target == "t1");

    CHECK_THROWS_AS(decode_journal("not json"), BlobstripError);
    CHECK_THROWS_AS(decode_journal(R"({"version": 7, "backup_namespace": "", "changes": []})"),
                    BlobstripError);
}
