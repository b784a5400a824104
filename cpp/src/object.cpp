#include "blobstrip/object.h"
#include "blobstrip/error.h"

#include <git2.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace blobstrip {

// ---------------------------------------------------------------------------
// libgit2 lifecycle: initialise once per process
// ---------------------------------------------------------------------------

namespace {
struct LibGit2Init {
    LibGit2Init()  { git_libgit2_init(); }
    ~LibGit2Init() { git_libgit2_shutdown(); }
};
static LibGit2Init s_libgit2;

git_object_t to_git_type(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::Blob:   return GIT_OBJECT_BLOB;
        case ObjectKind::Tree:   return GIT_OBJECT_TREE;
        case ObjectKind::Commit: return GIT_OBJECT_COMMIT;
        case ObjectKind::Tag:    return GIT_OBJECT_TAG;
    }
    return GIT_OBJECT_INVALID; // unreachable
}

std::string oid_to_hex(const git_oid* oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), oid);
    return std::string(buf, GIT_OID_HEXSZ);
}

void append(std::vector<uint8_t>& out, const std::string& s) {
    out.insert(out.end(), s.begin(), s.end());
}

/// Header value with embedded newlines continued by a leading space.
std::string fold_header(const std::string& key, const std::string& value) {
    std::string out = key + " ";
    for (char c : value) {
        out.push_back(c);
        if (c == '\n') out.push_back(' ');
    }
    out.push_back('\n');
    return out;
}

/// Split "key value\n key-continuation\n...\n\nmessage" into headers and
/// message. Throws CorruptObjectError on a header line without a key.
std::pair<ExtraHeaders, std::string>
split_headers(const Object& obj, const ObjectId& id) {
    std::string text(obj.data.begin(), obj.data.end());
    ExtraHeaders headers;

    size_t pos = 0;
    while (pos < text.size()) {
        size_t eol = text.find('\n', pos);
        if (eol == std::string::npos) eol = text.size();
        std::string line = text.substr(pos, eol - pos);
        pos = eol + 1;

        if (line.empty()) {
            return {std::move(headers), pos <= text.size() ? text.substr(pos) : std::string()};
        }
        if (line[0] == ' ') {
            if (headers.empty()) throw CorruptObjectError(id, "continuation line without header");
            headers.back().second += "\n" + line.substr(1);
            continue;
        }
        auto sp = line.find(' ');
        if (sp == std::string::npos || sp == 0) {
            throw CorruptObjectError(id, "malformed header line '" + line + "'");
        }
        headers.emplace_back(line.substr(0, sp), line.substr(sp + 1));
    }
    return {std::move(headers), std::string()};
}

void require_kind(const Object& obj, ObjectKind kind, const ObjectId& id) {
    if (obj.kind != kind) {
        throw CorruptObjectError(id, std::string("expected ") + kind_name(kind) +
                                     ", found " + kind_name(obj.kind));
    }
}

void require_id(const std::string& value, const ObjectId& id, const char* field) {
    if (!is_valid_id(value)) {
        throw CorruptObjectError(id, std::string("bad ") + field + " id '" + value + "'");
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Kinds
// ---------------------------------------------------------------------------

const char* kind_name(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::Blob:   return "blob";
        case ObjectKind::Tree:   return "tree";
        case ObjectKind::Commit: return "commit";
        case ObjectKind::Tag:    return "tag";
    }
    return "unknown";
}

std::optional<ObjectKind> kind_from_name(const std::string& name) {
    if (name == "blob")   return ObjectKind::Blob;
    if (name == "tree")   return ObjectKind::Tree;
    if (name == "commit") return ObjectKind::Commit;
    if (name == "tag")    return ObjectKind::Tag;
    return std::nullopt;
}

int64_t Commit::time() const {
    // "Name <email> 1700000000 +0100"
    auto gt = committer.rfind('>');
    if (gt == std::string::npos) return 0;
    const char* p = committer.c_str() + gt + 1;
    char* end = nullptr;
    long long t = std::strtoll(p, &end, 10);
    return end == p ? 0 : static_cast<int64_t>(t);
}

// ---------------------------------------------------------------------------
// Ids
// ---------------------------------------------------------------------------

ObjectId hash_object(const Object& obj) {
    git_oid oid;
    const void* data = obj.data.empty() ? static_cast<const void*>("") : obj.data.data();
    if (git_odb_hash(&oid, data, obj.data.size(),
                     to_git_type(obj.kind)) != 0) {
        const git_error* e = git_error_last();
        throw GitError(std::string("git_odb_hash") +
                       (e && e->message ? std::string(": ") + e->message : ""));
    }
    return oid_to_hex(&oid);
}

bool is_valid_id(const std::string& id) {
    if (id.size() != GIT_OID_HEXSZ) return false;
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

void sort_tree_entries(std::vector<TreeEntry>& entries) {
    auto key = [](const TreeEntry& e) {
        return e.is_tree() ? e.name + "/" : e.name;
    };
    std::sort(entries.begin(), entries.end(),
              [&](const TreeEntry& a, const TreeEntry& b) { return key(a) < key(b); });
}

// ---------------------------------------------------------------------------
// Trees
// ---------------------------------------------------------------------------

Object encode_tree(const Tree& tree) {
    Object obj{ObjectKind::Tree, {}};
    for (auto& e : tree.entries) {
        char mode[16];
        std::snprintf(mode, sizeof(mode), "%o", e.mode);
        append(obj.data, std::string(mode) + " " + e.name);
        obj.data.push_back('\0');

        git_oid oid;
        if (git_oid_fromstr(&oid, e.id.c_str()) != 0) throw InvalidHashError(e.id);
        obj.data.insert(obj.data.end(), oid.id, oid.id + GIT_OID_RAWSZ);
    }
    return obj;
}

Tree decode_tree(const Object& obj, const ObjectId& id) {
    require_kind(obj, ObjectKind::Tree, id);

    Tree tree;
    const auto& d = obj.data;
    size_t pos = 0;
    while (pos < d.size()) {
        auto sp = std::find(d.begin() + pos, d.end(), ' ');
        if (sp == d.end()) throw CorruptObjectError(id, "tree entry without mode");
        std::string mode_str(d.begin() + pos, sp);

        auto nul = std::find(sp + 1, d.end(), '\0');
        if (nul == d.end()) throw CorruptObjectError(id, "tree entry without name terminator");
        std::string name(sp + 1, nul);

        size_t oid_pos = static_cast<size_t>(nul - d.begin()) + 1;
        if (oid_pos + GIT_OID_RAWSZ > d.size()) {
            throw CorruptObjectError(id, "truncated tree entry '" + name + "'");
        }

        char* end = nullptr;
        unsigned long mode = std::strtoul(mode_str.c_str(), &end, 8);
        if (mode_str.empty() || *end != '\0' || name.empty()) {
            throw CorruptObjectError(id, "malformed tree entry '" + name + "'");
        }

        git_oid oid;
        git_oid_fromraw(&oid, d.data() + oid_pos);

        tree.entries.push_back({name, static_cast<uint32_t>(mode), oid_to_hex(&oid)});
        pos = oid_pos + GIT_OID_RAWSZ;
    }
    return tree;
}

// ---------------------------------------------------------------------------
// Commits
// ---------------------------------------------------------------------------

Object encode_commit(const Commit& c) {
    Object obj{ObjectKind::Commit, {}};
    append(obj.data, "tree " + c.tree + "\n");
    for (auto& p : c.parents) append(obj.data, "parent " + p + "\n");
    append(obj.data, "author " + c.author + "\n");
    append(obj.data, "committer " + c.committer + "\n");
    for (auto& [key, value] : c.extra_headers) append(obj.data, fold_header(key, value));
    append(obj.data, "\n");
    append(obj.data, c.message);
    return obj;
}

Commit decode_commit(const Object& obj, const ObjectId& id) {
    require_kind(obj, ObjectKind::Commit, id);
    auto [headers, message] = split_headers(obj, id);

    Commit c;
    bool have_tree = false, have_author = false, have_committer = false;
    for (auto& [key, value] : headers) {
        if (key == "tree" && !have_tree) {
            require_id(value, id, "tree");
            c.tree = value;
            have_tree = true;
        } else if (key == "parent") {
            require_id(value, id, "parent");
            c.parents.push_back(value);
        } else if (key == "author" && !have_author) {
            c.author = value;
            have_author = true;
        } else if (key == "committer" && !have_committer) {
            c.committer = value;
            have_committer = true;
        } else {
            c.extra_headers.emplace_back(key, value);
        }
    }
    if (!have_tree)      throw CorruptObjectError(id, "commit has no tree");
    if (!have_author)    throw CorruptObjectError(id, "commit has no author");
    if (!have_committer) throw CorruptObjectError(id, "commit has no committer");

    c.message = std::move(message);
    return c;
}

// ---------------------------------------------------------------------------
// Tags
// ---------------------------------------------------------------------------

Object encode_tag(const Tag& t) {
    Object obj{ObjectKind::Tag, {}};
    append(obj.data, "object " + t.object + "\n");
    append(obj.data, std::string("type ") + kind_name(t.type) + "\n");
    append(obj.data, "tag " + t.name + "\n");
    if (t.tagger) append(obj.data, "tagger " + *t.tagger + "\n");
    for (auto& [key, value] : t.extra_headers) append(obj.data, fold_header(key, value));
    append(obj.data, "\n");
    append(obj.data, t.message);
    return obj;
}

Tag decode_tag(const Object& obj, const ObjectId& id) {
    require_kind(obj, ObjectKind::Tag, id);
    auto [headers, message] = split_headers(obj, id);

    Tag t;
    bool have_object = false, have_type = false;
    for (auto& [key, value] : headers) {
        if (key == "object" && !have_object) {
            require_id(value, id, "object");
            t.object = value;
            have_object = true;
        } else if (key == "type" && !have_type) {
            auto kind = kind_from_name(value);
            if (!kind) throw CorruptObjectError(id, "unknown tag type '" + value + "'");
            t.type = *kind;
            have_type = true;
        } else if (key == "tag" && t.name.empty()) {
            t.name = value;
        } else if (key == "tagger" && !t.tagger) {
            t.tagger = value;
        } else {
            t.extra_headers.emplace_back(key, value);
        }
    }
    if (!have_object) throw CorruptObjectError(id, "tag has no object");
    if (!have_type)   throw CorruptObjectError(id, "tag has no type");

    t.message = std::move(message);
    return t;
}

} // namespace blobstrip
