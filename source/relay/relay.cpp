#include "relay/relay.hpp"

#include "mcp/mcp_dispatch.hpp"
#include "mcp/response_rewriter.hpp"
#include "platform/platform_abi.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <csignal>
#include <future>
#include <memory>
#include <thread>
#include <unistd.h>

namespace relay {

using json = json_rpc::json;

static bool is_blank(const std::string &line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char character) { return std::isspace(character) != 0; });
}

// Route one client line. Returns false once either destination is gone.
static bool relay_client_line(const std::string &line,
                              mcp_stdio::LineWriter &upstream_input,
                              mcp_stdio::LineWriter &client_output,
                              const policy::PolicyStore &store,
                              request_tracker::RequestTracker &tracker) {
    json parsed;
    try {
        parsed = json::parse(line);
    } catch (const json::parse_error &error) {
        // Not JSON: forward as-is rather than drop it.
        debug_log::log("Forwarding undecodable line: " + std::string(error.what()));
        return upstream_input.write_line(line);
    }

    if (parsed.is_object()) {
        mcp_dispatch::Decision decision = mcp_dispatch::classify_message(parsed, store, tracker);
        if (decision.action == mcp_dispatch::Action::Forward) {
            return upstream_input.write_line(line);
        }
        return client_output.write_line(json_rpc::encode(decision.response));
    }

    if (parsed.is_array()) {
        mcp_dispatch::BatchDecision batch = mcp_dispatch::classify_batch(parsed, store, tracker);
        if (batch.responses.empty()) {
            return upstream_input.write_line(line);
        }
        if (!batch.forward.empty() && !upstream_input.write_line(json_rpc::encode(batch.forward))) {
            return false;
        }
        return client_output.write_line(json_rpc::encode(batch.responses));
    }

    return upstream_input.write_line(line);
}

void run_outbound(int client_input_fd,
                  int upstream_input_fd,
                  mcp_stdio::LineWriter &client_output,
                  const policy::PolicyStore &store,
                  request_tracker::RequestTracker &tracker) {
    mcp_stdio::LineReader client_reader(client_input_fd);
    mcp_stdio::LineWriter upstream_input(upstream_input_fd);

    std::string line;
    while (client_reader.read_line(line)) {
        if (is_blank(line)) {
            continue;
        }
        if (!relay_client_line(line, upstream_input, client_output, store, tracker)) {
            debug_log::log("Output pipe closed. Stopping client->upstream relay.");
            return;
        }
    }
    debug_log::log("EOF on client input.");
}

void run_inbound(int upstream_output_fd,
                 mcp_stdio::LineWriter &client_output,
                 request_tracker::RequestTracker &tracker) {
    mcp_stdio::LineReader upstream_reader(upstream_output_fd);

    std::string line;
    while (upstream_reader.read_line(line)) {
        if (!client_output.write_line(response_rewriter::rewrite_response_line(line, tracker))) {
            debug_log::log("Client output closed. Stopping upstream->client relay.");
            return;
        }
    }
    debug_log::log("EOF on upstream output.");
}

// Everything the inbound thread touches. Shared so a thread that is still
// blocked on a grandchild's output can outlive run_session().
struct InboundState {
    InboundState(int client_output_fd, int output_fd)
        : client_output(client_output_fd), upstream_output_fd(output_fd) {}

    request_tracker::RequestTracker tracker;
    mcp_stdio::LineWriter client_output;
    int upstream_output_fd;
    std::promise<void> finished;
};

int run_session(const policy::PolicyStore &store,
                const std::vector<std::string> &upstream_command,
                int client_input_fd,
                int client_output_fd,
                std::chrono::milliseconds drain_timeout) {
    // Broken pipes are reported through write() instead of killing us.
    std::signal(SIGPIPE, SIG_IGN);

    if (upstream_command.empty()) {
        mcp_stdio::log_message("No upstream command given.");
        return SPAWN_FAILURE_EXIT_CODE;
    }

    std::vector<std::string> arguments(upstream_command.begin() + 1, upstream_command.end());
    platform::SpawnResult spawned = platform::spawn_process_with_pipes(upstream_command.front(), arguments);
    if (!spawned.success) {
        mcp_stdio::log_message("Failed to start upstream: " + spawned.error_message);
        return SPAWN_FAILURE_EXIT_CODE;
    }
    debug_log::log("Started upstream '" + upstream_command.front() + "' (pid " +
                   std::to_string(spawned.process_id) + ").");

    auto inbound = std::make_shared<InboundState>(client_output_fd, spawned.stdout_fd);
    std::future<void> inbound_finished = inbound->finished.get_future();
    std::thread inbound_thread([inbound]() {
        run_inbound(inbound->upstream_output_fd, inbound->client_output, inbound->tracker);
        // Once nobody reads, let the upstream see EPIPE instead of blocking.
        platform::close_descriptor(inbound->upstream_output_fd);
        inbound->finished.set_value();
    });

    run_outbound(client_input_fd, spawned.stdin_fd, inbound->client_output, store, inbound->tracker);

    // EOF downstream.
    platform::close_descriptor(spawned.stdin_fd);

    int exit_code = platform::wait_for_exit(spawned.process_id);

    // Output written before the exit is drained. A descendant that still
    // holds the upstream's stdout must not keep the session alive.
    if (inbound_finished.wait_for(drain_timeout) == std::future_status::ready) {
        inbound_thread.join();
    } else {
        debug_log::log("Upstream output still open after exit; abandoning the inbound relay.");
        inbound_thread.detach();
    }

    if (exit_code < 0) {
        mcp_stdio::log_message("Could not collect upstream exit status.");
        return 1;
    }
    debug_log::log("Upstream exited with code " + std::to_string(exit_code) + ".");
    return exit_code;
}

int run(const policy::PolicyStore &store, const std::vector<std::string> &upstream_command) {
    return run_session(store, upstream_command, STDIN_FILENO, STDOUT_FILENO, DRAIN_TIMEOUT);
}

} // namespace relay
