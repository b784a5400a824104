#include "internal.h"
#include "blobstrip/error.h"

#include <string>

namespace blobstrip {
namespace paths {

/// Validate a full git reference name ("refs/heads/main").
/// Rejects colons, spaces, tabs, control chars, .., @{, empty components,
/// trailing dot or slash, .lock suffix.
void validate_ref_name(const std::string& name) {
    if (name.empty()) {
        throw InvalidRefNameError("ref name must not be empty");
    }

    for (char ch : name) {
        if (static_cast<unsigned char>(ch) < 0x20 || ch == 0x7f) {
            throw InvalidRefNameError("ref name contains a control character");
        }
        switch (ch) {
            case ':': case ' ': case '\\': case '^': case '~':
            case '?': case '*': case '[':
                throw InvalidRefNameError(
                    std::string("ref name contains invalid character: '") +
                    ch + "'");
            default: break;
        }
    }

    if (name.find("..") != std::string::npos) {
        throw InvalidRefNameError("ref name must not contain '..'");
    }

    if (name.find("@{") != std::string::npos) {
        throw InvalidRefNameError("ref name must not contain '@{'");
    }

    if (name.find("//") != std::string::npos || name.front() == '/' ||
        name.back() == '/') {
        throw InvalidRefNameError("ref name has an empty component: " + name);
    }

    if (name.back() == '.') {
        throw InvalidRefNameError("ref name must not end with '.'");
    }

    if (name.size() >= 5 && name.substr(name.size() - 5) == ".lock") {
        throw InvalidRefNameError("ref name must not end with '.lock'");
    }
}

/// "dir" + "/" + "name", or just "name" at the root.
std::string join(const std::string& dir, const std::string& name) {
    return dir.empty() ? name : dir + "/" + name;
}

} // namespace paths
} // namespace blobstrip
