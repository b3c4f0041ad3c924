#ifndef MCPGATE_MCP_TOOLS_HPP
#define MCPGATE_MCP_TOOLS_HPP

// Local tools: tools answered by the filter itself, never forwarded upstream.
// Their descriptors are appended to every tracked tools/list response.

#include "protocol/json_rpc.hpp"
#include "policy/policy_store.hpp"

#include <functional>
#include <string>
#include <vector>

namespace mcp_tools {

using json = json_rpc::json;

// Name of the policy introspection tool.
extern const char *const ACCESS_POLICY_TOOL_NAME;

// A local tool handler: receives the arguments JSON and the active policy,
// returns the tools/call result payload (content array, as per MCP spec).
using ToolHandler = std::function<json(const json &arguments, const policy::PolicyStore &store)>;

// Description of a local tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    ToolHandler handler;
};

// All local tools, in the order they are appended to tools/list results.
const std::vector<ToolDefinition> &get_local_tools();

// Returns nullptr if name is not a local tool.
const ToolDefinition *find_local_tool(const std::string &tool_name);

// {name, description, inputSchema} entry as it appears in tools/list.
json build_descriptor(const ToolDefinition &definition);

// Descriptors of all local tools, as a JSON array.
json local_tool_descriptors();

// The policy document returned (as text) by get_access_policy.
json build_policy_document(const policy::PolicyStore &store);

} // namespace mcp_tools

#endif // MCPGATE_MCP_TOOLS_HPP
