// Tests for the relay loops over real pipes, and for whole sessions against
// small /bin/sh and /bin/cat upstreams.

#include "mcp/mcp_stdio.hpp"
#include "mcp/request_tracker.hpp"
#include "platform/platform_abi.hpp"
#include "policy/policy_store.hpp"
#include "protocol/json_rpc.hpp"
#include "relay/relay.hpp"

#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace test_relay {

using json = json_rpc::json;
using policy::PolicyStore;

struct Pipe {
    int read_fd = -1;
    int write_fd = -1;
};

static bool check(bool condition, const std::string &test_description) {
    if (condition) {
        std::cout << "  OK: " << test_description << std::endl;
    } else {
        std::cout << "  FAIL: " << test_description << std::endl;
    }
    return condition;
}

static Pipe make_pipe() {
    int descriptors[2] = {-1, -1};
    Pipe result;
    // Close-on-exec so spawned upstreams never hold the test's pipe ends.
    if (pipe2(descriptors, O_CLOEXEC) == 0) {
        result.read_fd = descriptors[0];
        result.write_fd = descriptors[1];
    }
    return result;
}

static void close_pipe(Pipe &pipe_pair) {
    platform::close_descriptor(pipe_pair.read_fd);
    platform::close_descriptor(pipe_pair.write_fd);
}

// Write lines to a pipe and close its write end, as a client that sends a
// few requests and then disconnects.
static void feed_and_close(Pipe &pipe_pair, const std::vector<std::string> &lines) {
    mcp_stdio::LineWriter writer(pipe_pair.write_fd);
    for (const auto &line : lines) {
        writer.write_line(line);
    }
    platform::close_descriptor(pipe_pair.write_fd);
}

// Drain a pipe whose write end is already closed.
static std::vector<std::string> read_all_lines(int read_fd) {
    std::vector<std::string> lines;
    mcp_stdio::LineReader reader(read_fd);
    std::string line;
    while (reader.read_line(line)) {
        lines.push_back(line);
    }
    return lines;
}

static const json *find_by_id(const std::vector<json> &messages, const json &request_id) {
    for (const auto &message : messages) {
        if (message.is_object() && message.contains("id") && message["id"] == request_id) {
            return &message;
        }
    }
    return nullptr;
}

static std::vector<json> parse_lines(const std::vector<std::string> &lines) {
    std::vector<json> messages;
    for (const auto &line : lines) {
        try {
            messages.push_back(json::parse(line));
        } catch (const json::parse_error &error) {
            (void)error;
            messages.push_back(line);
        }
    }
    return messages;
}

static bool test_line_reader_final_line_without_newline() {
    Pipe pipe_pair = make_pipe();
    const std::string data = "first\r\n\nlast";
    bool written = ::write(pipe_pair.write_fd, data.data(), data.size()) == static_cast<ssize_t>(data.size());
    platform::close_descriptor(pipe_pair.write_fd);
    std::vector<std::string> lines = read_all_lines(pipe_pair.read_fd);
    close_pipe(pipe_pair);
    bool success = written && lines == std::vector<std::string>{"first\r", "", "last"};
    return check(success, "LineReader splits on newline and returns an unterminated last line");
}

static bool test_outbound_routes_lines() {
    PolicyStore store({"get_me"}, {}, {});
    request_tracker::RequestTracker tracker;
    Pipe client_input = make_pipe();
    Pipe upstream_input = make_pipe();
    Pipe client_output = make_pipe();

    const std::string tools_list = R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})";
    const std::string initialize = R"({"jsonrpc": "2.0", "id": 3, "method": "initialize"})";
    feed_and_close(client_input, {
        "",
        "   ",
        "not json",
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"merge_pull_request"}})",
        tools_list,
        initialize,
        R"([{"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"get_me"}},)"
        R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"delete_file"}}])",
    });

    {
        mcp_stdio::LineWriter client_writer(client_output.write_fd);
        relay::run_outbound(client_input.read_fd, upstream_input.write_fd, client_writer, store, tracker);
    }
    platform::close_descriptor(upstream_input.write_fd);
    platform::close_descriptor(client_output.write_fd);

    std::vector<std::string> upstream_lines = read_all_lines(upstream_input.read_fd);
    std::vector<json> client_messages = parse_lines(read_all_lines(client_output.read_fd));
    close_pipe(client_input);
    close_pipe(upstream_input);
    close_pipe(client_output);

    bool upstream_ok = upstream_lines.size() == 4 &&
                       upstream_lines[0] == "not json" &&
                       upstream_lines[1] == tools_list &&
                       upstream_lines[2] == initialize &&
                       json::parse(upstream_lines[3]).size() == 1 &&
                       json::parse(upstream_lines[3])[0]["id"] == 4;

    const json *denied = find_by_id(client_messages, 1);
    bool client_ok = client_messages.size() == 2 &&
                     denied != nullptr &&
                     (*denied)["error"]["message"].get<std::string>().find("permanently disabled") !=
                         std::string::npos &&
                     client_messages[1].is_array() &&
                     client_messages[1].size() == 1 &&
                     client_messages[1][0]["id"] == 5;

    return check(upstream_ok && client_ok && tracker.is_tracked(2),
                 "Outbound loop forwards, intercepts, skips blanks and splits batches");
}

static bool test_inbound_rewrites_tracked_response() {
    request_tracker::RequestTracker tracker;
    tracker.track(2);
    Pipe upstream_output = make_pipe();
    Pipe client_output = make_pipe();

    const std::string notification = R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})";
    feed_and_close(upstream_output, {
        notification,
        R"({"jsonrpc":"2.0","id":2,"result":{"tools":[{"name":"get_me"}]}})",
        "noise",
    });

    {
        mcp_stdio::LineWriter client_writer(client_output.write_fd);
        relay::run_inbound(upstream_output.read_fd, client_writer, tracker);
    }
    platform::close_descriptor(client_output.write_fd);
    std::vector<std::string> lines = read_all_lines(client_output.read_fd);
    close_pipe(upstream_output);
    close_pipe(client_output);

    bool success = lines.size() == 3 &&
                   lines[0] == notification &&
                   json::parse(lines[1])["result"]["tools"].size() == 2 &&
                   json::parse(lines[1])["result"]["tools"][1]["name"] == "get_access_policy" &&
                   lines[2] == "noise" &&
                   tracker.size() == 0;
    return check(success, "Inbound loop extends tracked tools/list and passes the rest through");
}

static bool test_inbound_stops_when_client_gone() {
    std::signal(SIGPIPE, SIG_IGN);
    request_tracker::RequestTracker tracker;
    tracker.track(1);
    Pipe upstream_output = make_pipe();
    Pipe client_output = make_pipe();
    platform::close_descriptor(client_output.read_fd);

    // The upstream side stays open: only the broken client pipe can end the loop.
    mcp_stdio::LineWriter upstream_writer(upstream_output.write_fd);
    upstream_writer.write_line(R"({"jsonrpc":"2.0","id":1,"result":{"tools":[]}})");

    {
        mcp_stdio::LineWriter client_writer(client_output.write_fd);
        relay::run_inbound(upstream_output.read_fd, client_writer, tracker);
    }
    // Reaching this point with the upstream write end still open means the
    // loop ended on the failed client write, after rewriting the response.
    bool upstream_still_open = upstream_writer.write_line(R"({"jsonrpc":"2.0","id":2,"result":{}})");
    bool success = tracker.size() == 0 && upstream_still_open;
    close_pipe(upstream_output);
    close_pipe(client_output);
    return check(success, "Inbound loop returns on a broken client pipe with the upstream still open");
}

static bool test_outbound_stops_when_upstream_gone() {
    std::signal(SIGPIPE, SIG_IGN);
    PolicyStore store({}, {}, {});
    request_tracker::RequestTracker tracker;
    Pipe client_input = make_pipe();
    Pipe upstream_input = make_pipe();
    Pipe client_output = make_pipe();
    platform::close_descriptor(upstream_input.read_fd);

    // The client side stays open: only the broken upstream pipe can end the loop.
    mcp_stdio::LineWriter client_writer(client_input.write_fd);
    client_writer.write_line(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");

    {
        mcp_stdio::LineWriter client_output_writer(client_output.write_fd);
        relay::run_outbound(client_input.read_fd, upstream_input.write_fd, client_output_writer, store, tracker);
    }
    bool client_still_open = client_writer.write_line(R"({"jsonrpc":"2.0","id":2,"method":"ping"})");
    platform::close_descriptor(client_output.write_fd);
    bool nothing_answered = read_all_lines(client_output.read_fd).empty();
    close_pipe(client_input);
    close_pipe(upstream_input);
    close_pipe(client_output);
    return check(client_still_open && nothing_answered,
                 "Outbound loop returns on a broken upstream pipe with the client still open");
}

static bool test_session_not_held_by_upstream_descendant() {
    PolicyStore store({}, {}, {});
    Pipe client_input = make_pipe();
    Pipe client_output = make_pipe();
    platform::close_descriptor(client_input.write_fd);

    // The background sleep inherits the upstream's stdout and keeps it open
    // after the shell itself has exited.
    auto started = std::chrono::steady_clock::now();
    int exit_code = relay::run_session(store, {"/bin/sh", "-c", "sleep 1 & exit 3"},
                                       client_input.read_fd, client_output.write_fd,
                                       std::chrono::milliseconds(100));
    auto elapsed = std::chrono::steady_clock::now() - started;

    // Let the sleep finish so the abandoned inbound relay sees EOF and ends
    // before the client pipe is closed.
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    close_pipe(client_input);
    close_pipe(client_output);

    bool success = exit_code == 3 && elapsed < std::chrono::milliseconds(900);
    return check(success, "Session returns after the drain timeout while a descendant holds upstream stdout");
}

static bool test_session_end_to_end() {
    PolicyStore store({"get_me"}, {"myorg"}, {});
    Pipe client_input = make_pipe();
    Pipe client_output = make_pipe();

    // Answers the first forwarded request (tools/list id 2), then drains its
    // input until EOF and exits with a distinctive status.
    const std::string script =
        "read request; "
        "printf '%s\\n' '{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":{\"tools\":[{\"name\":\"get_me\"}]}}'; "
        "cat >/dev/null; exit 5";

    feed_and_close(client_input, {
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"merge_pull_request"}})",
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})",
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"get_me","arguments":{"owner":"badorg"}}})",
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
    });

    int exit_code = relay::run_session(store, {"/bin/sh", "-c", script},
                                       client_input.read_fd, client_output.write_fd);
    platform::close_descriptor(client_output.write_fd);
    std::vector<json> messages = parse_lines(read_all_lines(client_output.read_fd));
    close_pipe(client_input);
    close_pipe(client_output);

    const json *blocked = find_by_id(messages, 1);
    const json *tools_list = find_by_id(messages, 2);
    const json *denied = find_by_id(messages, 3);

    bool success = exit_code == 5 &&
                   messages.size() == 3 &&
                   blocked != nullptr && blocked->contains("error") &&
                   denied != nullptr &&
                   (*denied)["error"]["message"].get<std::string>().find("Access denied: 'badorg'") !=
                       std::string::npos &&
                   tools_list != nullptr &&
                   (*tools_list)["result"]["tools"].size() == 2 &&
                   (*tools_list)["result"]["tools"][1]["name"] == "get_access_policy";
    if (!success) {
        std::cout << "  exit code: " << exit_code << ", messages: " << messages.size() << std::endl;
    }
    return check(success, "Session intercepts denials, extends tools/list and returns the upstream exit code");
}

static bool test_session_passes_non_json_through_cat() {
    PolicyStore store({}, {}, {});
    Pipe client_input = make_pipe();
    Pipe client_output = make_pipe();
    feed_and_close(client_input, {"hello upstream"});

    int exit_code = relay::run_session(store, {"cat"}, client_input.read_fd, client_output.write_fd);
    platform::close_descriptor(client_output.write_fd);
    std::vector<std::string> lines = read_all_lines(client_output.read_fd);
    close_pipe(client_input);
    close_pipe(client_output);

    bool success = exit_code == 0 && lines == std::vector<std::string>{"hello upstream"};
    return check(success, "Non-JSON input reaches the upstream and its echo reaches the client");
}

static bool test_session_exit_codes() {
    PolicyStore store({}, {}, {});

    Pipe first_input = make_pipe();
    Pipe first_output = make_pipe();
    platform::close_descriptor(first_input.write_fd);
    int signaled = relay::run_session(store, {"/bin/sh", "-c", "kill -TERM $$"},
                                      first_input.read_fd, first_output.write_fd);
    close_pipe(first_input);
    close_pipe(first_output);

    Pipe second_input = make_pipe();
    Pipe second_output = make_pipe();
    platform::close_descriptor(second_input.write_fd);
    int missing = relay::run_session(store, {"/nonexistent/mcpgate-upstream"},
                                     second_input.read_fd, second_output.write_fd);
    close_pipe(second_input);
    close_pipe(second_output);

    bool success = signaled == 128 + SIGTERM && missing == relay::SPAWN_FAILURE_EXIT_CODE;
    return check(success, "Signal deaths map to 128+N and a missing upstream to 127");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_line_reader_final_line_without_newline();
    all_passed &= test_outbound_routes_lines();
    all_passed &= test_inbound_rewrites_tracked_response();
    all_passed &= test_inbound_stops_when_client_gone();
    all_passed &= test_outbound_stops_when_upstream_gone();
    all_passed &= test_session_end_to_end();
    all_passed &= test_session_passes_non_json_through_cat();
    all_passed &= test_session_exit_codes();
    all_passed &= test_session_not_held_by_upstream_descendant();
    return all_passed;
}

} // namespace test_relay
