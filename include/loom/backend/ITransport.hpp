#pragma once

#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace loom {
namespace backend {

/**
 * @brief Everything the model sees for one turn
 */
struct ModelRequest {
    std::string model;                                   ///< Model identifier
    std::string instructions;                            ///< System instructions for the agent
    std::vector<Message> messages;                       ///< Full conversation history
    nlohmann::json tools = nlohmann::json::array();      ///< Function-calling schemas offered this turn
    std::optional<double> temperature;                   ///< Sampling temperature, transport default if unset
    std::optional<std::string> trace_id;                 ///< Trace correlation id
    std::optional<std::string> span_id;                  ///< Span correlation id
};

/**
 * @brief The model's reply for one turn
 */
struct ModelResponse {
    std::string text;                    ///< Concatenated output text (may be empty)
    std::vector<ToolCall> tool_calls;    ///< Tool calls in the order the model emitted them
    TokenUsage usage;                    ///< Tokens consumed by this turn
};

enum class TransportEventType {
    TextDelta,       ///< A fragment of output text
    ToolCallDelta,   ///< A fully assembled tool call
    TurnComplete     ///< The response is complete
};

struct TransportEvent {
    TransportEventType type;
    std::string text;                    ///< Text fragment (TextDelta only)
    std::optional<ToolCall> tool_call;   ///< Tool call (ToolCallDelta only)
};

using TransportEventCallback = std::function<void(const TransportEvent&)>;

/**
 * @brief Abstract interface to the model provider
 *
 * Wire format, authentication and retry policy belong to implementations.
 * The execution engine only depends on this interface, which also enables
 * dependency injection for testing.
 *
 * Implementations must tolerate concurrent calls when one transport is
 * shared between agents that run in parallel.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Send a request and block until the complete response arrives
     *
     * @param request Conversation, tools and model for this turn
     * @return Expected<ModelResponse> Response or a transport error
     */
    virtual Expected<ModelResponse> send(const ModelRequest& request) = 0;

    /**
     * @brief Send a request and report the response incrementally
     *
     * Events are delivered in order on the calling thread and end with
     * TurnComplete. The returned response equals the concatenation of the
     * delivered events.
     *
     * The default implementation performs a blocking send() and replays
     * the result as a single text delta followed by one event per tool call.
     *
     * @param request Conversation, tools and model for this turn
     * @param on_event Callback for each event
     * @return Expected<ModelResponse> Final response or a transport error
     */
    virtual Expected<ModelResponse> stream(const ModelRequest& request,
                                           const TransportEventCallback& on_event) {
        auto response = send(request);
        if (!response) {
            return response;
        }
        if (!response->text.empty()) {
            on_event(TransportEvent{TransportEventType::TextDelta, response->text, std::nullopt});
        }
        for (const auto& call : response->tool_calls) {
            on_event(TransportEvent{TransportEventType::ToolCallDelta, {}, call});
        }
        on_event(TransportEvent{TransportEventType::TurnComplete, {}, std::nullopt});
        return response;
    }
};

} // namespace backend
} // namespace loom
