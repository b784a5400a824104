#include "blobstrip/json.h"

#include <cctype>
#include <limits>

namespace blobstrip {

using nlohmann::json;

// ---------------------------------------------------------------------------
// Reports
// ---------------------------------------------------------------------------

void to_json(json& j, const RefChange& c) {
    j = json{{"ref", c.ref_name}, {"old", c.old_target}, {"new", c.new_target}};
}

void from_json(const json& j, RefChange& c) {
    j.at("ref").get_to(c.ref_name);
    j.at("old").get_to(c.old_target);
    j.at("new").get_to(c.new_target);
}

void to_json(json& j, const StrippedBlob& b) {
    j = json{{"id", b.id}, {"size", b.size}, {"path", b.path}};
    if (b.replacement) {
        j["replacement"] = *b.replacement;
    } else {
        j["replacement"] = nullptr;
    }
}

void to_json(json& j, const RewriteReport& r) {
    j = json{
        {"code", result_code_name(r.code)},
        {"dry_run", r.dry_run},
        {"rewritten_commit_count", r.rewritten_commit_count},
        {"stripped_blob_count", r.stripped_blob_count},
        {"bytes_reclaimed_estimate", r.bytes_reclaimed_estimate},
        {"offending_blob_count", r.offending_blob_count()},
        {"offending_total_bytes", r.offending_total_bytes()},
        {"objects_written", r.objects_written},
        {"affected_commit_ids", r.affected_commit_ids},
        {"affected_ref_names", r.affected_ref_names},
        {"ref_changes", r.ref_changes},
        {"stripped_blobs", r.stripped_blobs},
    };
    if (r.detached_head) j["detached_head"] = *r.detached_head;
}

void to_json(json& j, const GcReport& r) {
    j = json{
        {"expired_refs", r.expired_refs},
        {"objects_removed", r.objects_removed},
        {"bytes_freed", r.bytes_freed},
        {"journal_cleared", r.journal_cleared},
        {"performed_work", r.performed_work()},
    };
}

void to_json(json& j, const RollbackReport& r) {
    j = json{{"restored", r.restored}};
}

// ---------------------------------------------------------------------------
// Policy
// ---------------------------------------------------------------------------

void to_json(json& j, const Policy& p) {
    j = json{{"size_threshold_bytes", p.size_threshold_bytes},
             {"strip_mode", strip_mode_name(p.strip_mode)}};
    if (p.path_patterns) j["path_patterns"] = *p.path_patterns;
}

int64_t parse_size(const std::string& text) {
    size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;

    size_t digits_start = i;
    int64_t value = 0;
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        int d = text[i] - '0';
        if (value > (max - d) / 10) throw PolicyInvalidError("size too large: " + text);
        value = value * 10 + d;
        ++i;
    }
    if (i == digits_start) throw PolicyInvalidError("not a size: '" + text + "'");

    int64_t unit = 1;
    if (i < text.size()) {
        switch (std::toupper(static_cast<unsigned char>(text[i]))) {
            case 'K': unit = int64_t(1) << 10; ++i; break;
            case 'M': unit = int64_t(1) << 20; ++i; break;
            case 'G': unit = int64_t(1) << 30; ++i; break;
            default: break;
        }
        // Optional "B" or "iB" after the unit ("100MB", "100MiB")
        if (unit != 1 && i < text.size() && text[i] == 'i') ++i;
        if (i < text.size() && std::toupper(static_cast<unsigned char>(text[i])) == 'B') ++i;
    }
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    if (i != text.size()) throw PolicyInvalidError("not a size: '" + text + "'");

    if (value > max / unit) throw PolicyInvalidError("size too large: " + text);
    return value * unit;
}

Policy policy_from_json(const json& j) {
    if (!j.is_object()) throw PolicyInvalidError("policy must be a JSON object");

    Policy p;
    try {
        for (auto& [key, value] : j.items()) {
            if (key == "size_threshold_bytes") {
                if (value.is_string()) {
                    p.size_threshold_bytes = parse_size(value.get<std::string>());
                } else if (value.is_number_integer()) {
                    p.size_threshold_bytes = value.get<int64_t>();
                } else {
                    throw PolicyInvalidError("size_threshold_bytes must be an integer or size string");
                }
            } else if (key == "path_patterns") {
                if (!value.is_null()) p.path_patterns = value.get<std::vector<std::string>>();
            } else if (key == "strip_mode") {
                auto name = value.get<std::string>();
                auto mode = strip_mode_from_name(name);
                if (!mode) throw PolicyInvalidError("unknown strip_mode: " + name);
                p.strip_mode = *mode;
            } else {
                throw PolicyInvalidError("unknown policy key: " + key);
            }
        }
    } catch (const json::exception& e) {
        throw PolicyInvalidError(e.what());
    }

    if (!j.contains("size_threshold_bytes")) {
        throw PolicyInvalidError("size_threshold_bytes is required");
    }
    p.validate();
    return p;
}

// ---------------------------------------------------------------------------
// Journal
// ---------------------------------------------------------------------------

std::string encode_journal(const RewriteJournal& journal) {
    json j{{"version", 1},
           {"backup_namespace", journal.backup_namespace},
           {"changes", journal.changes}};
    return j.dump(2) + "\n";
}

RewriteJournal decode_journal(const std::string& text) {
    try {
        json j = json::parse(text);
        if (j.at("version").get<int>() != 1) {
            throw BlobstripError("unsupported journal version");
        }
        RewriteJournal journal;
        j.at("backup_namespace").get_to(journal.backup_namespace);
        j.at("changes").get_to(journal.changes);
        return journal;
    } catch (const json::exception& e) {
        throw BlobstripError(std::string("malformed rewrite journal: ") + e.what());
    }
}

} // namespace blobstrip
