#include "policy/access_matcher.hpp"

#include <fnmatch.h>

namespace policy {

bool glob_match(const std::string &pattern, const std::string &text) {
    return fnmatch(pattern.c_str(), text.c_str(), FNM_NOESCAPE) == 0;
}

bool matches_any(const std::vector<std::string> &patterns, const std::string &text) {
    for (const auto &pattern : patterns) {
        if (glob_match(pattern, text)) {
            return true;
        }
    }
    return false;
}

// An empty owner or repo string counts as not supplied.
static bool has_value(const std::optional<std::string> &value) {
    return value && !value->empty();
}

bool is_allowed(const PolicyStore &store,
                const std::optional<std::string> &owner,
                const std::optional<std::string> &repo) {
    if (!store.is_restricted()) {
        return true; // passthrough: rely on token scoping
    }

    bool has_owner = has_value(owner);
    bool has_repo = has_value(repo);

    if (has_repo && !has_owner) {
        return false;
    }

    if (has_owner && matches_any(store.allowed_orgs(), *owner)) {
        return true;
    }

    if (has_owner && has_repo && matches_any(store.allowed_repos(), *owner + "/" + *repo)) {
        return true;
    }

    return false;
}

} // namespace policy
