#pragma once

#include <ctxbroker/core/types.h>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace ctxbroker::mcp {

using json = nlohmann::json;

// A JSON-RPC response, or an Error. Notifications use Error{Success, "notification"}.
using MessageResult = Result<json>;

enum class TransportState : int { Disconnected = 0, Connected = 1, Closing = 2 };

// Protocol constants (constexpr for compile-time validation)
namespace protocol {
constexpr std::string_view JSONRPC_VERSION = "2.0";
constexpr std::string_view LATEST_PROTOCOL_VERSION = "2025-06-18";

// Error codes from JSON-RPC 2.0 specification
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
// Server-defined range
constexpr int SERVER_SHUTTING_DOWN = -32000;
constexpr int RESOURCE_NOT_FOUND = -32002;
} // namespace protocol

// Maps a core error onto the closest JSON-RPC error code.
constexpr int jsonRpcCodeFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound:
        case ErrorCode::InvalidArgument:
        case ErrorCode::InvalidData: return protocol::INVALID_PARAMS;
        case ErrorCode::SystemShutdown: return protocol::SERVER_SHUTTING_DOWN;
        default: return protocol::INTERNAL_ERROR;
    }
}

// JSON parsing utilities with error handling
namespace json_utils {
// Safe JSON parsing without exceptions
inline Result<json> parse_json(std::string_view input) noexcept {
    if (input.empty()) {
        return Error{ErrorCode::InvalidData, "Empty input string for JSON parsing"};
    }

    try {
        return json::parse(input);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, std::string("JSON parse error: ") + e.what() +
                                                 " at position " + std::to_string(e.byte)};
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("JSON parsing failed: ") + e.what()};
    }
}

// Validate JSON-RPC message structure
inline Result<json> validate_jsonrpc_message(const json& msg) noexcept {
    if (!msg.is_object()) {
        return Error{ErrorCode::InvalidData, "Message must be a JSON object"};
    }

    const auto it = msg.find("jsonrpc");
    if (it == msg.end()) {
        return Error{ErrorCode::InvalidData, "Missing 'jsonrpc' field"};
    }
    if (!it->is_string() || it->get<std::string>() != protocol::JSONRPC_VERSION) {
        return Error{ErrorCode::InvalidData, "Invalid or missing jsonrpc version"};
    }

    const auto method = msg.find("method");
    if (method != msg.end() && !method->is_string()) {
        return Error{ErrorCode::InvalidData, "'method' must be a string"};
    }

    return msg;
}
} // namespace json_utils

} // namespace ctxbroker::mcp
