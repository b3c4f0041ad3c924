#ifndef MCPGATE_JSON_RPC_HPP
#define MCPGATE_JSON_RPC_HPP

// JSON-RPC 2.0 helpers for MCP protocol communication.
// Uses nlohmann/json for parsing and serialization. ordered_json keeps the
// key order of upstream messages intact when a line has to be re-encoded.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::ordered_json;

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// JSON-RPC "invalid request" code, used for every policy denial.
constexpr int INVALID_REQUEST = -32600;

// Extract method name from a JSON-RPC request/notification. Returns empty if missing.
std::string get_method(const json &message);

// Extract the id from a JSON-RPC message. Returns nullptr json if missing (notification).
json get_id(const json &message);

// Extract params from a JSON-RPC message. Returns empty object if missing.
json get_params(const json &message);

// Check if a message is a notification (no id field).
bool is_notification(const json &message);

// True if the message carries a non-null string or numeric id, i.e. one that
// can be correlated with a later response.
bool has_usable_id(const json &message);

// Serialize a message as a single line (no trailing newline). Invalid UTF-8
// is replaced rather than thrown on.
std::string encode(const json &message);

} // namespace json_rpc

#endif // MCPGATE_JSON_RPC_HPP
