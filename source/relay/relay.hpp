#ifndef MCPGATE_RELAY_HPP
#define MCPGATE_RELAY_HPP

// Bidirectional stdio relay between the MCP client and the upstream server.
//
//   client stdin  --> run_outbound --> upstream stdin   (policy checked)
//   upstream stdout --> run_inbound --> client stdout   (tools/list extended)
//
// Locally answered calls are written straight back to the client. The two
// loops share only the RequestTracker and the client LineWriter.

#include "mcp/mcp_stdio.hpp"
#include "mcp/request_tracker.hpp"
#include "policy/policy_store.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace relay {

// Exit code used when the upstream cannot be started.
constexpr int SPAWN_FAILURE_EXIT_CODE = 127;

// How long upstream output is drained after the upstream has exited.
constexpr std::chrono::milliseconds DRAIN_TIMEOUT(2000);

// Client->upstream loop. Returns when the client input ends or either
// output is gone. Does not close any descriptor.
void run_outbound(int client_input_fd,
                  int upstream_input_fd,
                  mcp_stdio::LineWriter &client_output,
                  const policy::PolicyStore &store,
                  request_tracker::RequestTracker &tracker);

// Upstream->client loop. Returns when the upstream output ends or the
// client is gone. Does not close any descriptor.
void run_inbound(int upstream_output_fd,
                 mcp_stdio::LineWriter &client_output,
                 request_tracker::RequestTracker &tracker);

// Spawn the upstream command and relay between it and the given client
// descriptors until the client input ends. Closes the upstream's stdin,
// waits for it to exit and drains its remaining output for at most
// drain_timeout, then returns its exit code (SPAWN_FAILURE_EXIT_CODE if it
// could not be started). An inbound relay still blocked after drain_timeout
// is left running detached and keeps writing to client_output_fd.
int run_session(const policy::PolicyStore &store,
                const std::vector<std::string> &upstream_command,
                int client_input_fd,
                int client_output_fd,
                std::chrono::milliseconds drain_timeout = DRAIN_TIMEOUT);

// run_session() on this process's stdin/stdout.
int run(const policy::PolicyStore &store, const std::vector<std::string> &upstream_command);

} // namespace relay

#endif // MCPGATE_RELAY_HPP
