#include "mcp/response_rewriter.hpp"

#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

namespace response_rewriter {

bool inject_local_tools(json &response, request_tracker::RequestTracker &tracker) {
    if (!response.is_object() || !response.contains("id")) {
        return false;
    }

    if (!tracker.consume(response["id"])) {
        return false;
    }

    // The id is spent at this point even if the payload is not a tool list
    // (error responses, unexpected shapes).
    if (!response.contains("result") || !response["result"].is_object()) {
        return false;
    }
    json &result = response["result"];
    if (!result.contains("tools") || !result["tools"].is_array()) {
        return false;
    }

    for (const auto &descriptor : mcp_tools::local_tool_descriptors()) {
        result["tools"].push_back(descriptor);
    }
    debug_log::log("Injected local tools into tools/list response " + json_rpc::encode(response["id"]));
    return true;
}

std::string rewrite_response_line(const std::string &line, request_tracker::RequestTracker &tracker) {
    json parsed;
    try {
        parsed = json::parse(line);
    } catch (const json::parse_error &error) {
        (void)error; // Not JSON-RPC (framing noise, blank line): pass it on.
        return line;
    }

    bool modified = false;
    if (parsed.is_array()) {
        for (auto &element : parsed) {
            modified |= inject_local_tools(element, tracker);
        }
    } else {
        modified = inject_local_tools(parsed, tracker);
    }

    return modified ? json_rpc::encode(parsed) : line;
}

} // namespace response_rewriter
