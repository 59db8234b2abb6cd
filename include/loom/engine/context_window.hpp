#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include "../backend/ITransport.hpp"
#include <algorithm>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace loom {
namespace engine {

// ============================================================================
// Token estimation
// ============================================================================

/** @brief Estimated token cost of one message. */
using TokenCounter = std::function<int(const Message&)>;

constexpr int kCharsPerToken = 4;
constexpr int kMessageOverheadTokens = 4;      ///< Role markers and separators
constexpr int kToolEntryOverheadTokens = 10;   ///< Call id, tool name and structure

/** @brief 4 chars per token, at least one token for non-empty text. */
inline int estimate_text_tokens(const std::string& text) {
    if (text.empty()) {
        return 0;
    }
    return std::max(1, static_cast<int>(text.size()) / kCharsPerToken);
}

/** @brief Default TokenCounter: content estimate plus per-entry overhead. */
inline int estimate_message_tokens(const Message& message) {
    const bool tool_entry = message.role == Role::Tool || message.is_tool_call();
    return estimate_text_tokens(message.content) +
           (tool_entry ? kToolEntryOverheadTokens : kMessageOverheadTokens);
}

inline int estimate_tokens(const std::vector<Message>& messages, const TokenCounter& counter) {
    int total = 0;
    for (const auto& message : messages) {
        total += counter(message);
    }
    return total;
}

// ============================================================================
// Strategies
// ============================================================================

/**
 * @brief Fits a history into a token budget before it is sent to the model
 *
 * Strategies only shape the request. The conversation context keeps its
 * full history.
 */
class ContextWindowStrategy {
public:
    virtual ~ContextWindowStrategy() = default;

    /**
     * @brief History to send instead of `history`
     *
     * Returns `history` unchanged when it already fits in `max_tokens`.
     */
    virtual std::vector<Message> manage(std::vector<Message> history, int max_tokens,
                                        const TokenCounter& counter) const = 0;
};

/**
 * @brief Keeps the newest messages that fit, dropping the oldest
 *
 * With preserve_system_messages, the system messages at the start of the
 * history are always kept and count against the budget. A window never
 * starts with a tool result whose request was dropped.
 */
class SlidingWindowStrategy : public ContextWindowStrategy {
public:
    explicit SlidingWindowStrategy(bool preserve_system_messages = false)
        : preserve_system_messages_(preserve_system_messages)
    {}

    bool preserves_system_messages() const { return preserve_system_messages_; }

    std::vector<Message> manage(std::vector<Message> history, int max_tokens,
                                const TokenCounter& counter) const override {
        if (max_tokens <= 0 || estimate_tokens(history, counter) <= max_tokens) {
            return history;
        }

        size_t preserved = 0;
        int used = 0;
        if (preserve_system_messages_) {
            while (preserved < history.size() && history[preserved].role == Role::System) {
                used += counter(history[preserved]);
                ++preserved;
            }
        }

        size_t first_kept = history.size();
        while (first_kept > preserved) {
            const int cost = counter(history[first_kept - 1]);
            if (used + cost > max_tokens) {
                break;
            }
            used += cost;
            --first_kept;
        }
        while (first_kept < history.size() && history[first_kept].role == Role::Tool) {
            ++first_kept;
        }

        std::vector<Message> window;
        window.reserve(preserved + history.size() - first_kept);
        std::move(history.begin(), history.begin() + static_cast<std::ptrdiff_t>(preserved),
                  std::back_inserter(window));
        std::move(history.begin() + static_cast<std::ptrdiff_t>(first_kept), history.end(),
                  std::back_inserter(window));

        log::get_logger()->debug("Context window dropped {} of {} messages",
                                 history.size() - window.size(), history.size());
        return window;
    }

private:
    bool preserve_system_messages_;
};

/**
 * @brief Replaces older messages with a model-written summary
 *
 * The newest keep_recent messages are sent verbatim after a system message
 * "[Previous conversation summary] ...". Falls back to a sliding window
 * when the recent messages alone, or together with the summary, exceed
 * the budget. A failed summarization call yields a placeholder summary.
 *
 * Each over-budget request costs one extra model call.
 */
class SummarizationStrategy : public ContextWindowStrategy {
public:
    static constexpr const char* kDefaultPrompt =
        "Summarize the following conversation history concisely, preserving key information, "
        "decisions made, and any context that would be important for continuing the conversation. "
        "Focus on facts, user preferences, and any commitments made.\n\n"
        "Conversation to summarize:\n";
    static constexpr const char* kFailedSummary = "[Summarization failed - context truncated]";

    /**
     * @param transport Transport used for the summarization call
     * @param model Model that writes the summary
     * @param keep_recent Messages kept verbatim (values below 1 mean 5)
     * @param prompt Text placed before the transcript
     */
    SummarizationStrategy(std::shared_ptr<backend::ITransport> transport, std::string model,
                          int keep_recent = 5, std::string prompt = kDefaultPrompt)
        : transport_(std::move(transport))
        , model_(std::move(model))
        , keep_recent_(keep_recent > 0 ? keep_recent : 5)
        , prompt_(std::move(prompt))
    {}

    const std::string& model() const { return model_; }
    int keep_recent() const { return keep_recent_; }

    std::vector<Message> manage(std::vector<Message> history, int max_tokens,
                                const TokenCounter& counter) const override {
        if (max_tokens <= 0 || history.empty() || estimate_tokens(history, counter) <= max_tokens) {
            return history;
        }

        const size_t recent_count = std::min(static_cast<size_t>(keep_recent_), history.size());
        const auto recent_begin = history.end() - static_cast<std::ptrdiff_t>(recent_count);
        std::vector<Message> recent(recent_begin, history.end());
        const int recent_tokens = estimate_tokens(recent, counter);
        if (recent_tokens >= max_tokens) {
            return SlidingWindowStrategy().manage(std::move(history), max_tokens, counter);
        }

        std::vector<Message> older(history.begin(), recent_begin);
        if (older.empty()) {
            return recent;
        }

        Message summary = Message::system("[Previous conversation summary] " + summarize(older));
        if (recent_tokens + counter(summary) > max_tokens) {
            return SlidingWindowStrategy().manage(std::move(history), max_tokens, counter);
        }

        std::vector<Message> window;
        window.reserve(recent.size() + 1);
        window.push_back(std::move(summary));
        std::move(recent.begin(), recent.end(), std::back_inserter(window));
        return window;
    }

    /** @brief Transcript line for one message. */
    static std::string format(const Message& message) {
        if (message.role == Role::Tool) {
            return "Tool Result: " + message.content;
        }
        if (message.is_tool_call()) {
            return "Tool Call: " + message.tool_name.value_or("") + " " + message.content;
        }
        return std::string(role_to_string(message.role)) + ": " + message.content;
    }

private:
    std::string summarize(const std::vector<Message>& messages) const {
        std::string transcript;
        for (const auto& message : messages) {
            if (!transcript.empty()) {
                transcript += "\n";
            }
            transcript += format(message);
        }

        backend::ModelRequest request;
        request.model = model_;
        request.messages.push_back(Message::user(prompt_ + transcript));

        if (!transport_) {
            log::get_logger()->warn("Context summarization has no transport");
            return kFailedSummary;
        }
        auto response = transport_->send(request);
        if (!response) {
            log::get_logger()->warn("Context summarization failed: {}", response.error().to_string());
            return kFailedSummary;
        }
        return response->text;
    }

    std::shared_ptr<backend::ITransport> transport_;
    std::string model_;
    int keep_recent_;
    std::string prompt_;
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Context window management of one agent
 */
struct ContextWindowConfig {
    std::shared_ptr<ContextWindowStrategy> strategy;   ///< Required
    int max_tokens = 0;                                ///< Budget for the history (> 0)
    TokenCounter token_counter;                        ///< Defaults to estimate_message_tokens

    Expected<void> validate() const {
        if (!strategy) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Context window strategy cannot be null"});
        }
        if (max_tokens <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Context window max_tokens must be positive"});
        }
        return {};
    }

    /** @brief History to send for `history`. */
    std::vector<Message> apply(std::vector<Message> history) const {
        const TokenCounter& counter = token_counter ? token_counter : default_counter();
        return strategy->manage(std::move(history), max_tokens, counter);
    }

private:
    static const TokenCounter& default_counter() {
        static const TokenCounter counter = estimate_message_tokens;
        return counter;
    }
};

} // namespace engine
} // namespace loom
