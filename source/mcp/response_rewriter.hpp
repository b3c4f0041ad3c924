#ifndef MCPGATE_RESPONSE_REWRITER_HPP
#define MCPGATE_RESPONSE_REWRITER_HPP

// Upstream->client rewriting: appends the local tool descriptors to the
// result of every tracked tools/list request.

#include "protocol/json_rpc.hpp"
#include "mcp/request_tracker.hpp"

#include <string>

namespace response_rewriter {

using json = json_rpc::json;

// Rewrite one decoded response in place. Consumes the response id from the
// tracker if it was pending, whether or not the payload can be extended.
// Returns true if the message was modified.
bool inject_local_tools(json &response, request_tracker::RequestTracker &tracker);

// Rewrite one raw line (without its trailing newline). Lines that are not
// JSON, or that need no change, are returned byte-for-byte unchanged.
// Batches are rewritten element by element.
std::string rewrite_response_line(const std::string &line, request_tracker::RequestTracker &tracker);

} // namespace response_rewriter

#endif // MCPGATE_RESPONSE_REWRITER_HPP
