#include "policy/policy_store.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace policy {

namespace {

std::string trim(const std::string &text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        begin++;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        end--;
    }
    return text.substr(begin, end - begin);
}

std::string read_environment(const char *name) {
    const char *value = std::getenv(name);
    return (value == nullptr) ? std::string() : std::string(value);
}

} // namespace

const std::string &default_tool_list() {
    static const std::string tools =
        "get_file_contents,list_branches,list_commits,get_commit,"
        "create_branch,push_files,create_or_update_file,delete_file,"
        "create_pull_request,list_pull_requests,pull_request_read,"
        "pull_request_review_write,add_comment_to_pending_review,"
        "update_pull_request,update_pull_request_branch,"
        "issue_read,issue_write,add_issue_comment,list_issues,"
        "list_issue_types,sub_issue_write,"
        "search_code,search_repositories,search_pull_requests,search_issues,"
        "search_users,get_status,get_me,get_label,"
        "fork_repository,create_repository,"
        "get_latest_release,get_release_by_tag,list_releases,list_tags,get_tag,"
        "request_copilot_review";
    return tools;
}

std::vector<std::string> split_list(const std::string &text) {
    std::vector<std::string> entries;
    std::istringstream stream(text);
    std::string entry;
    while (std::getline(stream, entry, ',')) {
        entry = trim(entry);
        if (!entry.empty()) {
            entries.push_back(entry);
        }
    }
    return entries;
}

const std::set<std::string> &PolicyStore::permanently_blocked_tools() {
    static const std::set<std::string> blocked = {"merge_pull_request"};
    return blocked;
}

PolicyStore::PolicyStore(std::set<std::string> allowed_tools,
                         std::vector<std::string> allowed_orgs,
                         std::vector<std::string> allowed_repos)
    : allowed_tools_(std::move(allowed_tools)),
      blocked_tools_(permanently_blocked_tools()),
      allowed_orgs_(std::move(allowed_orgs)),
      allowed_repos_(std::move(allowed_repos)) {}

PolicyStore PolicyStore::from_environment() {
    const char *tools_value = std::getenv("GITHUB_TOOLS");
    std::string tools_text = (tools_value == nullptr) ? default_tool_list() : std::string(tools_value);

    std::vector<std::string> tool_entries = split_list(tools_text);
    std::set<std::string> allowed_tools(tool_entries.begin(), tool_entries.end());

    return PolicyStore(std::move(allowed_tools),
                       split_list(read_environment("ALLOWED_ORGS")),
                       split_list(read_environment("ALLOWED_REPOS")));
}

bool PolicyStore::is_tool_blocked(const std::string &tool_name) const {
    return blocked_tools_.count(tool_name) != 0;
}

bool PolicyStore::is_tool_allowed(const std::string &tool_name) const {
    return allowed_tools_.count(tool_name) != 0;
}

bool PolicyStore::is_restricted() const {
    return !allowed_orgs_.empty() || !allowed_repos_.empty();
}

std::string PolicyStore::mode() const {
    return is_restricted() ? "restricted" : "passthrough";
}

} // namespace policy
