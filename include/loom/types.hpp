#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <tl/expected.hpp>

namespace loom {

// ============================================================================
// Message Types
// ============================================================================

/**
 * @brief Message role in conversation flow
 *
 * Defines the source and purpose of a message in the conversation history.
 */
enum class Role {
    System,     ///< Instructions that guide model behavior
    User,       ///< Input from the end user
    Assistant,  ///< Model-generated text or a tool request
    Tool        ///< Result of a tool execution
};

[[nodiscard]] inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<Role> role_from_string(std::string_view name) {
    if (name == "system") return Role::System;
    if (name == "user") return Role::User;
    if (name == "assistant") return Role::Assistant;
    if (name == "tool") return Role::Tool;
    return std::nullopt;
}

/**
 * @brief A tool invocation requested by the model
 *
 * `id` identifies the request item, `call_id` correlates the request with
 * the result appended later. Arguments stay opaque text until the tool is
 * resolved and its schema is known.
 */
struct ToolCall {
    std::string id;          ///< Response item identifier
    std::string call_id;     ///< Correlation id shared by request and result
    std::string name;        ///< Tool name selected by the model
    std::string arguments;   ///< Raw JSON argument text

    bool operator==(const ToolCall& other) const {
        return id == other.id &&
               call_id == other.call_id &&
               name == other.name &&
               arguments == other.arguments;
    }

    bool operator!=(const ToolCall& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Single entry in conversation history
 *
 * Tool requests are stored as assistant entries carrying the call id and
 * tool name, with the argument text as content. Tool results are stored
 * as tool entries carrying the same call id.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Message {
    Role role;                                 ///< Message role
    std::string content;                       ///< Text content (argument text for tool requests)
    std::optional<std::string> tool_call_id;   ///< Correlation id (tool requests and results)
    std::optional<std::string> tool_name;      ///< Tool name (tool requests and results)

    static Message system(std::string content) {
        return Message{Role::System, std::move(content), std::nullopt, std::nullopt};
    }

    static Message user(std::string content) {
        return Message{Role::User, std::move(content), std::nullopt, std::nullopt};
    }

    static Message assistant(std::string content) {
        return Message{Role::Assistant, std::move(content), std::nullopt, std::nullopt};
    }

    static Message tool_call(const ToolCall& call) {
        return Message{Role::Assistant, call.arguments, call.call_id, call.name};
    }

    static Message tool_result(std::string call_id, std::string name, std::string output) {
        return Message{Role::Tool, std::move(output), std::move(call_id), std::move(name)};
    }

    /** @brief True for an assistant entry that records a tool request. */
    bool is_tool_call() const {
        return role == Role::Assistant && tool_call_id.has_value();
    }

    bool operator==(const Message& other) const {
        return role == other.role &&
               content == other.content &&
               tool_call_id == other.tool_call_id &&
               tool_name == other.tool_name;
    }

    bool operator!=(const Message& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Record of one completed tool call within a run
 */
struct ToolExecution {
    std::string tool_name;                                   ///< Tool that was called
    std::string call_id;                                     ///< Correlation id of the originating call
    std::string arguments;                                   ///< Raw argument text
    std::string output;                                      ///< Result text shown to the model
    bool success = false;                                    ///< False for unknown, invalid, failing or rejected calls
    std::chrono::milliseconds latency{0};                    ///< Wall time spent executing
};

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * - 100-199: Configuration errors
 * - 200-299: Transport errors
 * - 300-399: Execution engine errors
 * - 400-499: Runtime errors
 * - 500-599: Tool errors
 * - 600-699: Orchestration errors
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,
    UnknownGuardrail = 101,
    UnknownTool = 102,
    UnknownHandoffTarget = 103,

    // Transport errors (200-299)
    TransportFailure = 200,
    MalformedResponse = 201,

    // Engine errors (300-399)
    InputRejected = 300,
    OutputRejected = 301,
    TurnLimitExceeded = 302,
    InvalidResumeState = 303,
    InvalidRunState = 304,
    HandoffFailed = 305,
    MissingUserInput = 306,

    // Runtime errors (400-499)
    RequestCancelled = 400,

    // Tool errors (500-599)
    ToolNotFound = 500,
    ToolExecutionFailed = 501,
    InvalidToolArguments = 502,
    ToolRejected = 503,

    // Orchestration errors (600-699)
    NoRouteMatched = 600,
    DepartmentNotFound = 601,
    MemberFailed = 602,

    // Unknown
    Unknown = 999
};

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type representing a library error. Used with tl::expected for
 * composable error handling without exceptions.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (agent names, upstream errors)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }
};

template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// Usage
// ============================================================================

/**
 * @brief Token usage reported by the transport, summed across turns
 */
struct TokenUsage {
    int input_tokens = 0;
    int output_tokens = 0;
    int total_tokens = 0;

    TokenUsage& operator+=(const TokenUsage& other) {
        input_tokens += other.input_tokens;
        output_tokens += other.output_tokens;
        total_tokens += other.total_tokens;
        return *this;
    }

    bool operator==(const TokenUsage& other) const {
        return input_tokens == other.input_tokens &&
               output_tokens == other.output_tokens &&
               total_tokens == other.total_tokens;
    }

    bool operator!=(const TokenUsage& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Cancellation
// ============================================================================

/**
 * @brief Cooperative cancellation flag shared between a caller and a run
 *
 * Tokens form a chain: a token obtained from child() reports cancelled
 * when it or any ancestor is cancelled, while cancelling the child leaves
 * the parent untouched. A default-constructed token can never be
 * cancelled.
 *
 * @threadsafety Copies share state; all methods are thread-safe.
 */
class CancelToken {
public:
    CancelToken() = default;

    /** @brief Create a new root token. */
    static CancelToken create() {
        return CancelToken(std::make_shared<State>(nullptr));
    }

    /** @brief Create a token that is also cancelled when this one is. */
    CancelToken child() const {
        return CancelToken(std::make_shared<State>(state_));
    }

    /** @brief Request cancellation. No-op on a default-constructed token. */
    void cancel() const {
        if (state_) {
            state_->cancelled.store(true, std::memory_order_release);
        }
    }

    bool is_cancelled() const {
        for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
            if (s->cancelled.load(std::memory_order_acquire)) {
                return true;
            }
        }
        return false;
    }

private:
    struct State {
        explicit State(std::shared_ptr<State> parent)
            : parent(std::move(parent)) {}

        std::atomic<bool> cancelled{false};
        std::shared_ptr<State> parent;
    };

    explicit CancelToken(std::shared_ptr<State> state)
        : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

// ============================================================================
// Approval
// ============================================================================

/**
 * @brief Decision returned by an approval handler for a confirmable tool call
 */
struct ApprovalDecision {
    bool approved = false;
    std::string reason;   ///< Rejection reason shown to the model

    static ApprovalDecision approve() {
        return ApprovalDecision{true, {}};
    }

    static ApprovalDecision reject(std::string reason = {}) {
        return ApprovalDecision{false, std::move(reason)};
    }
};

/** @brief Synchronous approval callback, invoked on the run's own thread. */
using ApprovalHandler = std::function<ApprovalDecision(const ToolCall&)>;

// ============================================================================
// Naming
// ============================================================================

/**
 * @brief Convert a display name into a tool-safe snake_case identifier
 *
 * "ResearchAgent" -> "research_agent", "Billing Team" -> "billing_team".
 */
inline std::string to_snake_case(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 4);
    for (size_t i = 0; i < name.size(); ++i) {
        const auto c = static_cast<unsigned char>(name[i]);
        if (std::isupper(c)) {
            if (i > 0 && !out.empty() && out.back() != '_') {
                const auto prev = static_cast<unsigned char>(name[i - 1]);
                if (std::islower(prev) || std::isdigit(prev)) {
                    out.push_back('_');
                }
            }
            out.push_back(static_cast<char>(std::tolower(c)));
        } else if (std::isalnum(c)) {
            out.push_back(static_cast<char>(c));
        } else if (!out.empty() && out.back() != '_') {
            out.push_back('_');
        }
    }
    while (!out.empty() && out.back() == '_') {
        out.pop_back();
    }
    return out;
}

} // namespace loom
