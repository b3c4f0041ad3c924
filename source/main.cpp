// mcpgate – access-control filter for MCP tool servers.
// Entry point: loads the policy, spawns the upstream server and relays
// JSON-RPC between it and the client on stdin/stdout.
//
// Usage: mcpgate [upstream-executable [args...]]
// Default upstream: github-mcp-server stdio
//
// Logs go to stderr (permitted by MCP spec).

#include <cstdlib>
#include <string>
#include <vector>

#include "mcp/mcp_stdio.hpp"
#include "policy/policy_store.hpp"
#include "relay/relay.hpp"
#include "utils/debug_log.hpp"

static std::vector<std::string> build_upstream_command(int argc, char **argv) {
    if (argc > 1) {
        return std::vector<std::string>(argv + 1, argv + argc);
    }
    return {"github-mcp-server", "stdio"};
}

static std::string join(const std::vector<std::string> &entries, const std::string &separator) {
    std::string joined;
    for (const auto &entry : entries) {
        if (!joined.empty()) {
            joined += separator;
        }
        joined += entry;
    }
    return joined;
}

int main(int argc, char **argv) {
    // The upstream sees the same effective tool list as the filter.
    if (setenv("GITHUB_TOOLS", policy::default_tool_list().c_str(), 0) != 0) {
        mcp_stdio::log_message("Could not export default GITHUB_TOOLS.");
    }

    policy::PolicyStore store = policy::PolicyStore::from_environment();

    const char *token = std::getenv("GITHUB_PERSONAL_ACCESS_TOKEN");
    if (token == nullptr || token[0] == '\0') {
        mcp_stdio::log_message("Warning: GITHUB_PERSONAL_ACCESS_TOKEN is not set.");
    }

    mcp_stdio::log_message("Access policy mode: " + store.mode() + ", " +
                           std::to_string(store.allowed_tools().size()) + " tool(s) allowed.");
    if (store.is_restricted()) {
        mcp_stdio::log_message("Allowed orgs: [" + join(store.allowed_orgs(), ",") +
                               "], allowed repos: [" + join(store.allowed_repos(), ",") + "]");
    }

    std::vector<std::string> upstream_command = build_upstream_command(argc, argv);
    debug_log::log("Upstream command: " + join(upstream_command, " "));

    int exit_code = relay::run(store, upstream_command);

    mcp_stdio::log_message("mcpgate shut down.");
    return exit_code;
}
