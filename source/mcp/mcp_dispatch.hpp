#ifndef MCPGATE_MCP_DISPATCH_HPP
#define MCPGATE_MCP_DISPATCH_HPP

// Client->upstream message classification.
// Decides for each decoded client message whether it is forwarded to the
// upstream server or answered locally (policy denial or local tool call).

#include "protocol/json_rpc.hpp"
#include "policy/policy_store.hpp"
#include "mcp/request_tracker.hpp"

#include <vector>

namespace mcp_dispatch {

using json = json_rpc::json;

enum class Action {
    Forward,          // send the original line upstream
    SyntheticResult,  // answered locally with a success response
    SyntheticError,   // rejected locally with an error response
};

struct Decision {
    Action action = Action::Forward;
    json response; // null for Forward
};

// Classify one JSON-RPC message. tools/list requests with a usable id are
// registered in the tracker before this returns, i.e. before the line can
// reach the upstream.
Decision classify_message(const json &message,
                          const policy::PolicyStore &store,
                          request_tracker::RequestTracker &tracker);

struct BatchDecision {
    json forward = json::array();   // elements to send upstream, original order
    json responses = json::array(); // locally produced responses
};

// Classify every element of a JSON-RPC batch. Non-object elements are
// forwarded untouched.
BatchDecision classify_batch(const json &batch,
                             const policy::PolicyStore &store,
                             request_tracker::RequestTracker &tracker);

} // namespace mcp_dispatch

#endif // MCPGATE_MCP_DISPATCH_HPP
