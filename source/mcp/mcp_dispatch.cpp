#include "mcp/mcp_dispatch.hpp"

#include "mcp/mcp_tools.hpp"
#include "policy/access_matcher.hpp"
#include "utils/debug_log.hpp"

#include <optional>
#include <string>

// Access-control routing of client messages.
// Only tools/list (tracked) and tools/call (checked) are looked at; every
// other method and every notification passes through untouched.

namespace mcp_dispatch {

static Decision forward() {
    return Decision{};
}

static Decision reject(const json &request_id, const std::string &error_message) {
    debug_log::log("Rejected: " + error_message);
    Decision decision;
    decision.action = Action::SyntheticError;
    decision.response = json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST, error_message);
    return decision;
}

// Absent and null arguments are both "not supplied". Non-string values are
// matched by their JSON text.
static std::optional<std::string> get_scope_argument(const json &arguments, const char *key) {
    if (!arguments.contains(key) || arguments[key].is_null()) {
        return std::nullopt;
    }
    const json &value = arguments[key];
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return json_rpc::encode(value);
}

// Handle the "tools/list" request: remember the id so the response can be
// extended with the local tools, then let the upstream answer.
static Decision handle_tools_list(const json &message, request_tracker::RequestTracker &tracker) {
    if (json_rpc::has_usable_id(message)) {
        tracker.track(message["id"]);
        debug_log::log("Tracking tools/list request " + json_rpc::encode(message["id"]));
    }
    return forward();
}

// Handle the "tools/call" request.
static Decision handle_tools_call(const json &message, const policy::PolicyStore &store) {
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    std::string tool_name;
    if (params.contains("name") && params["name"].is_string()) {
        tool_name = params["name"].get<std::string>();
    }

    json arguments = json::object();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        arguments = params["arguments"];
    }

    // Local tools are answered before any policy check so the policy can
    // always be discovered.
    const mcp_tools::ToolDefinition *local_tool = mcp_tools::find_local_tool(tool_name);
    if (local_tool != nullptr) {
        debug_log::log("Handling local tool " + tool_name);
        Decision decision;
        decision.action = Action::SyntheticResult;
        decision.response = json_rpc::build_response(request_id, local_tool->handler(arguments, store));
        return decision;
    }

    if (store.is_tool_blocked(tool_name)) {
        return reject(request_id, "Tool '" + tool_name + "' is permanently disabled");
    }

    if (!store.is_tool_allowed(tool_name)) {
        return reject(request_id, "Tool '" + tool_name + "' is not permitted");
    }

    std::optional<std::string> owner = get_scope_argument(arguments, "owner");
    std::optional<std::string> repo = get_scope_argument(arguments, "repo");

    // Tools without owner/repo arguments (get_me, search_*) are not scoped.
    if (!owner && !repo) {
        return forward();
    }

    if (!policy::is_allowed(store, owner, repo)) {
        // An empty repo names the bare owner.
        std::string target = (repo && !repo->empty()) ? owner.value_or("") + "/" + *repo : owner.value_or("");
        return reject(request_id,
                      "Access denied: '" + target + "' is not in ALLOWED_ORGS or ALLOWED_REPOS");
    }

    return forward();
}

Decision classify_message(const json &message,
                          const policy::PolicyStore &store,
                          request_tracker::RequestTracker &tracker) {
    std::string method = json_rpc::get_method(message);

    if (method == "tools/list") {
        return handle_tools_list(message, tracker);
    }
    if (method == "tools/call") {
        return handle_tools_call(message, store);
    }
    return forward();
}

BatchDecision classify_batch(const json &batch,
                             const policy::PolicyStore &store,
                             request_tracker::RequestTracker &tracker) {
    BatchDecision result;
    for (const auto &element : batch) {
        if (!element.is_object()) {
            result.forward.push_back(element);
            continue;
        }
        Decision decision = classify_message(element, store, tracker);
        if (decision.action == Action::Forward) {
            result.forward.push_back(element);
        } else {
            result.responses.push_back(decision.response);
        }
    }
    return result;
}

} // namespace mcp_dispatch
