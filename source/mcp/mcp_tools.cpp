#include "mcp/mcp_tools.hpp"

namespace mcp_tools {

const char *const ACCESS_POLICY_TOOL_NAME = "get_access_policy";

json build_policy_document(const policy::PolicyStore &store) {
    // std::set iterates in sorted order, so both tool lists come out sorted.
    json document;
    document["allowed_tools"] = json::array();
    for (const auto &tool_name : store.allowed_tools()) {
        document["allowed_tools"].push_back(tool_name);
    }
    document["blocked_tools"] = json::array();
    for (const auto &tool_name : store.blocked_tools()) {
        document["blocked_tools"].push_back(tool_name);
    }
    document["allowed_orgs"] = store.allowed_orgs();
    document["allowed_repos"] = store.allowed_repos();
    document["mode"] = store.mode();
    return document;
}

static json handle_get_access_policy(const json &arguments, const policy::PolicyStore &store) {
    (void)arguments; // Takes no arguments.

    json text_content;
    text_content["type"] = "text";
    text_content["text"] = build_policy_document(store).dump(2, ' ', false, json::error_handler_t::replace);

    json result;
    result["content"] = json::array({text_content});
    return result;
}

static std::vector<ToolDefinition> build_local_tools() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["required"] = json::array();

    std::vector<ToolDefinition> tools;
    tools.push_back({
        ACCESS_POLICY_TOOL_NAME,
        "Returns the active MCP access-control policy: tool allowlist, "
        "permanently blocked tools, and org/repo restrictions.",
        input_schema,
        handle_get_access_policy
    });
    return tools;
}

const std::vector<ToolDefinition> &get_local_tools() {
    static const std::vector<ToolDefinition> local_tools = build_local_tools();
    return local_tools;
}

const ToolDefinition *find_local_tool(const std::string &tool_name) {
    for (const auto &tool : get_local_tools()) {
        if (tool.name == tool_name) {
            return &tool;
        }
    }
    return nullptr;
}

json build_descriptor(const ToolDefinition &definition) {
    json tool_entry;
    tool_entry["name"] = definition.name;
    tool_entry["description"] = definition.description;
    tool_entry["inputSchema"] = definition.input_schema;
    return tool_entry;
}

json local_tool_descriptors() {
    json descriptors = json::array();
    for (const auto &tool : get_local_tools()) {
        descriptors.push_back(build_descriptor(tool));
    }
    return descriptors;
}

} // namespace mcp_tools
