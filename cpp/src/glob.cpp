#include "internal.h"
#include "blobstrip/error.h"

#include <sstream>
#include <string>
#include <vector>

namespace blobstrip {
namespace glob {

namespace {

std::vector<std::string> split(const std::string& s) {
    std::vector<std::string> segs;
    std::istringstream iss(s);
    std::string seg;
    while (std::getline(iss, seg, '/')) {
        if (!seg.empty()) segs.push_back(seg);
    }
    return segs;
}

bool match_segments(const std::vector<std::string>& pat, size_t pi,
                    const std::vector<std::string>& segs, size_t si) {
    if (pi == pat.size()) return si == segs.size();

    if (pat[pi] == "**") {
        // Zero directories, or consume one and stay on "**"
        if (match_segments(pat, pi + 1, segs, si)) return true;
        return si < segs.size() && match_segments(pat, pi, segs, si + 1);
    }

    if (si == segs.size()) return false;
    if (!fnmatch(pat[pi], segs[si])) return false;
    return match_segments(pat, pi + 1, segs, si + 1);
}

} // anonymous namespace

/// Match a single pattern segment against a name.
/// Supports `*` (any sequence), `?` (any single char) and `[...]`
/// character classes with `!` negation and `a-z` ranges.
bool fnmatch(const std::string& pattern, const std::string& name) {
    size_t pi = 0, ni = 0;
    size_t plen = pattern.size(), nlen = name.size();

    while (pi < plen && ni < nlen) {
        char pc = pattern[pi];
        if (pc == '*') {
            // Skip consecutive stars
            while (pi < plen && pattern[pi] == '*') ++pi;
            if (pi == plen) return true; // trailing * matches rest
            // Try matching rest of pattern at each position
            std::string rest_pat = pattern.substr(pi);
            for (size_t k = ni; k <= nlen; ++k) {
                if (fnmatch(rest_pat, name.substr(k))) return true;
            }
            return false;
        } else if (pc == '?') {
            ++pi; ++ni;
        } else if (pc == '[') {
            // Character class
            ++pi;
            bool negate = (pi < plen && pattern[pi] == '!');
            if (negate) ++pi;
            bool matched = false;
            char ch = name[ni];
            while (pi < plen && pattern[pi] != ']') {
                if (pi + 2 < plen && pattern[pi + 1] == '-') {
                    if (ch >= pattern[pi] && ch <= pattern[pi + 2])
                        matched = true;
                    pi += 3;
                } else {
                    if (ch == pattern[pi]) matched = true;
                    ++pi;
                }
            }
            if (pi < plen) ++pi; // skip ']'
            if (matched == negate) return false;
            ++ni;
        } else {
            if (pc != name[ni]) return false;
            ++pi; ++ni;
        }
    }

    // Consume trailing stars
    while (pi < plen && pattern[pi] == '*') ++pi;

    return pi == plen && ni == nlen;
}

bool path_match(const std::string& pattern, const std::string& path) {
    if (pattern.find('/') == std::string::npos) {
        auto slash = path.rfind('/');
        std::string base = slash == std::string::npos ? path : path.substr(slash + 1);
        return fnmatch(pattern, base);
    }
    return match_segments(split(pattern), 0, split(path), 0);
}

void validate_pattern(const std::string& pattern) {
    if (pattern.empty()) {
        throw PolicyInvalidError("path pattern must not be empty");
    }

    // A single leading slash anchors at the root; other empty segments are
    // mistakes.
    std::string body = pattern.front() == '/' ? pattern.substr(1) : pattern;
    if (body.empty() || body.find("//") != std::string::npos || body.back() == '/') {
        throw PolicyInvalidError("path pattern has an empty segment: " + pattern);
    }
    for (auto& seg : split(body)) {
        if (seg == "..") {
            throw PolicyInvalidError("path pattern must not contain '..': " + pattern);
        }
    }

    bool in_class = false;
    for (char c : body) {
        if (c == '[' && !in_class) in_class = true;
        else if (c == ']' && in_class) in_class = false;
        else if (c == '/' && in_class) break;
    }
    if (in_class) {
        throw PolicyInvalidError("unterminated character class in: " + pattern);
    }
}

} // namespace glob
} // namespace blobstrip
