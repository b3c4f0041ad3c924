#ifndef MCPGATE_ACCESS_MATCHER_HPP
#define MCPGATE_ACCESS_MATCHER_HPP

// Owner / repository access decisions against a PolicyStore.
//
// An owner is allowed when it matches any ALLOWED_ORGS pattern; an
// owner/repo pair is additionally allowed when "owner/repo" matches any
// ALLOWED_REPOS pattern. With no patterns configured everything is allowed.

#include "policy/policy_store.hpp"

#include <optional>
#include <vector>
#include <string>

namespace policy {

// Shell-style wildcard match over the whole string (fnmatch(3), no escapes,
// '/' and leading '.' are ordinary characters). Case-sensitive.
bool glob_match(const std::string &pattern, const std::string &text);

// True if any pattern in the list matches text.
bool matches_any(const std::vector<std::string> &patterns, const std::string &text);

// A repo without an owner is always rejected once any restriction is active.
// Empty strings are treated like absent values.
bool is_allowed(const PolicyStore &store,
                const std::optional<std::string> &owner,
                const std::optional<std::string> &repo);

} // namespace policy

#endif // MCPGATE_ACCESS_MATCHER_HPP
