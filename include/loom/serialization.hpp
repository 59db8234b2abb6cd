#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace loom {
namespace serialization {

// ============================================================================
// Encoding
// ============================================================================

inline nlohmann::json encode(const Message& message) {
    nlohmann::json j;
    j["role"] = role_to_string(message.role);
    j["content"] = message.content;
    if (message.tool_call_id) {
        j["tool_call_id"] = *message.tool_call_id;
    }
    if (message.tool_name) {
        j["tool_name"] = *message.tool_name;
    }
    return j;
}

inline nlohmann::json encode(const ToolCall& call) {
    return nlohmann::json{
        {"id", call.id},
        {"call_id", call.call_id},
        {"name", call.name},
        {"arguments", call.arguments}
    };
}

inline nlohmann::json encode(const ToolExecution& execution) {
    return nlohmann::json{
        {"tool_name", execution.tool_name},
        {"call_id", execution.call_id},
        {"arguments", execution.arguments},
        {"output", execution.output},
        {"success", execution.success},
        {"latency_ms", execution.latency.count()}
    };
}

// ============================================================================
// Decoding
// ============================================================================

namespace detail {

inline Error malformed(const std::string& what, const nlohmann::json::exception& e) {
    return Error{ErrorCode::InvalidRunState, "Malformed " + what, std::string(e.what())};
}

} // namespace detail

inline Expected<Message> decode_message(const nlohmann::json& j) {
    try {
        const auto role_name = j.at("role").get<std::string>();
        auto role = role_from_string(role_name);
        if (!role) {
            return tl::unexpected(Error{ErrorCode::InvalidRunState, "Unknown message role: " + role_name});
        }
        Message message{*role, j.at("content").get<std::string>(), std::nullopt, std::nullopt};
        if (auto it = j.find("tool_call_id"); it != j.end() && !it->is_null()) {
            message.tool_call_id = it->get<std::string>();
        }
        if (auto it = j.find("tool_name"); it != j.end() && !it->is_null()) {
            message.tool_name = it->get<std::string>();
        }
        return message;
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(detail::malformed("message", e));
    }
}

inline Expected<ToolCall> decode_tool_call(const nlohmann::json& j) {
    try {
        return ToolCall{
            j.at("id").get<std::string>(),
            j.at("call_id").get<std::string>(),
            j.at("name").get<std::string>(),
            j.at("arguments").get<std::string>()
        };
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(detail::malformed("tool call", e));
    }
}

inline Expected<ToolExecution> decode_tool_execution(const nlohmann::json& j) {
    try {
        ToolExecution execution;
        execution.tool_name = j.at("tool_name").get<std::string>();
        execution.call_id = j.at("call_id").get<std::string>();
        execution.arguments = j.at("arguments").get<std::string>();
        execution.output = j.at("output").get<std::string>();
        execution.success = j.at("success").get<bool>();
        execution.latency = std::chrono::milliseconds(j.value("latency_ms", int64_t{0}));
        return execution;
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(detail::malformed("tool execution", e));
    }
}

} // namespace serialization
} // namespace loom
