#ifndef MCPGATE_POLICY_STORE_HPP
#define MCPGATE_POLICY_STORE_HPP

// Effective access-control policy: tool allowlist, permanently blocked tools,
// and the org / owner/repo glob patterns. Built once at startup and treated
// as read-only afterwards; tests build their own instance instead of
// mutating one.

#include <set>
#include <string>
#include <vector>

namespace policy {

class PolicyStore {
public:
    // Tools that can never be called, whatever GITHUB_TOOLS says.
    static const std::set<std::string> &permanently_blocked_tools();

    PolicyStore(std::set<std::string> allowed_tools,
                std::vector<std::string> allowed_orgs,
                std::vector<std::string> allowed_repos);

    // Read GITHUB_TOOLS, ALLOWED_ORGS and ALLOWED_REPOS from the environment.
    // An absent GITHUB_TOOLS selects default_tool_list(); absent or empty
    // org/repo lists mean "no restriction".
    static PolicyStore from_environment();

    bool is_tool_blocked(const std::string &tool_name) const;
    bool is_tool_allowed(const std::string &tool_name) const;

    const std::set<std::string> &allowed_tools() const { return allowed_tools_; }
    const std::set<std::string> &blocked_tools() const { return blocked_tools_; }
    const std::vector<std::string> &allowed_orgs() const { return allowed_orgs_; }
    const std::vector<std::string> &allowed_repos() const { return allowed_repos_; }

    // True when any org or repo pattern is configured.
    bool is_restricted() const;

    // "restricted" or "passthrough".
    std::string mode() const;

private:
    std::set<std::string> allowed_tools_;
    std::set<std::string> blocked_tools_;
    std::vector<std::string> allowed_orgs_;
    std::vector<std::string> allowed_repos_;
};

// Built-in GITHUB_TOOLS value. merge_pull_request is intentionally absent.
const std::string &default_tool_list();

// Split a comma-separated list, trimming whitespace and dropping empty entries.
std::vector<std::string> split_list(const std::string &text);

} // namespace policy

#endif // MCPGATE_POLICY_STORE_HPP
