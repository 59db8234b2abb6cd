#pragma once

#include "types.hpp"
#include "serialization.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstdio>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace loom {

namespace detail {

/** @brief Generate a random identifier of the form "<prefix><16 hex digits>". */
inline std::string generate_id(const std::string& prefix) {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};
    uint64_t value = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        value = engine();
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(value));
    return prefix + buf;
}

} // namespace detail

/**
 * @brief Conversation history, user state, and turn counter for one run
 *
 * History is append-only and ordered. State maps string keys to arbitrary
 * JSON values; storing null removes the key, so a cleared key and a
 * missing key look the same to callers. The turn counter is advanced once
 * per model call by the execution engine.
 *
 * Contexts are owned by the caller and never shared across concurrent
 * runs. fork() and friends produce independent copies for child runs.
 *
 * @threadsafety Not thread-safe. Fork before handing to another thread.
 */
class ConversationContext {
public:
    ConversationContext() = default;

    explicit ConversationContext(std::vector<Message> history)
        : history_(std::move(history)) {}

    // ========================================================================
    // History
    // ========================================================================

    void append(Message message) {
        history_.push_back(std::move(message));
    }

    const std::vector<Message>& history() const { return history_; }

    size_t size() const { return history_.size(); }

    /** @brief Content of the most recent user message, or empty if there is none. */
    std::string last_user_text() const {
        for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
            if (it->role == Role::User) {
                return it->content;
            }
        }
        return {};
    }

    // ========================================================================
    // State
    // ========================================================================

    void set_state(const std::string& key, nlohmann::json value) {
        if (value.is_null()) {
            state_.erase(key);
            return;
        }
        state_[key] = std::move(value);
    }

    std::optional<nlohmann::json> get_state(const std::string& key) const {
        auto it = state_.find(key);
        if (it == state_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool has_state(const std::string& key) const {
        return state_.find(key) != state_.end();
    }

    const std::map<std::string, nlohmann::json>& state() const { return state_; }

    // ========================================================================
    // Turns
    // ========================================================================

    int turn_count() const { return turn_count_; }

    /** @brief Advance the turn counter and return the new value. */
    int increment_turn() { return ++turn_count_; }

    // ========================================================================
    // Tracing
    // ========================================================================

    const std::optional<std::string>& parent_trace_id() const { return parent_trace_id_; }
    const std::optional<std::string>& parent_span_id() const { return parent_span_id_; }
    const std::optional<std::string>& request_id() const { return request_id_; }

    void set_trace(std::string trace_id, std::optional<std::string> span_id = std::nullopt) {
        parent_trace_id_ = std::move(trace_id);
        parent_span_id_ = std::move(span_id);
    }

    void set_request_id(std::string request_id) {
        request_id_ = std::move(request_id);
    }

    /** @brief Assign trace and span ids if the context has none yet. */
    void ensure_trace_context() {
        if (!parent_trace_id_) {
            parent_trace_id_ = detail::generate_id("trace_");
        }
        if (!parent_span_id_) {
            parent_span_id_ = detail::generate_id("span_");
        }
    }

    // ========================================================================
    // Forking
    // ========================================================================

    /** @brief Independent copy of history, state, turn counter and trace ids. */
    ConversationContext copy() const {
        return *this;
    }

    /**
     * @brief Copy for a child run: new span under the same trace, turn counter reset.
     */
    ConversationContext fork() const {
        ConversationContext child = *this;
        child.turn_count_ = 0;
        child.parent_span_id_ = detail::generate_id("span_");
        return child;
    }

    /** @brief Child context that starts with this state and an empty history. */
    ConversationContext fork_state_only() const {
        ConversationContext child;
        child.state_ = state_;
        child.parent_trace_id_ = parent_trace_id_;
        child.parent_span_id_ = detail::generate_id("span_");
        child.request_id_ = request_id_;
        return child;
    }

    /** @brief Empty child context that only inherits the trace. */
    ConversationContext fork_trace_only() const {
        ConversationContext child;
        child.parent_trace_id_ = parent_trace_id_;
        child.parent_span_id_ = detail::generate_id("span_");
        child.request_id_ = request_id_;
        return child;
    }

    // ========================================================================
    // Serialization
    // ========================================================================

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["history"] = nlohmann::json::array();
        for (const auto& message : history_) {
            j["history"].push_back(serialization::encode(message));
        }
        j["state"] = nlohmann::json::object();
        for (const auto& [key, value] : state_) {
            j["state"][key] = value;
        }
        j["turn_count"] = turn_count_;
        if (parent_trace_id_) j["parent_trace_id"] = *parent_trace_id_;
        if (parent_span_id_) j["parent_span_id"] = *parent_span_id_;
        if (request_id_) j["request_id"] = *request_id_;
        return j;
    }

    static Expected<ConversationContext> from_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            return tl::unexpected(Error{ErrorCode::InvalidRunState, "Context must be a JSON object"});
        }
        ConversationContext ctx;
        try {
            for (const auto& item : j.at("history")) {
                auto message = serialization::decode_message(item);
                if (!message) {
                    return tl::unexpected(message.error());
                }
                ctx.history_.push_back(std::move(*message));
            }
            if (auto it = j.find("state"); it != j.end()) {
                for (const auto& [key, value] : it->items()) {
                    ctx.set_state(key, value);
                }
            }
            ctx.turn_count_ = j.value("turn_count", 0);
            if (auto it = j.find("parent_trace_id"); it != j.end()) ctx.parent_trace_id_ = it->get<std::string>();
            if (auto it = j.find("parent_span_id"); it != j.end()) ctx.parent_span_id_ = it->get<std::string>();
            if (auto it = j.find("request_id"); it != j.end()) ctx.request_id_ = it->get<std::string>();
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{ErrorCode::InvalidRunState, "Malformed context", std::string(e.what())});
        }
        return ctx;
    }

private:
    std::vector<Message> history_;
    std::map<std::string, nlohmann::json> state_;
    int turn_count_ = 0;
    std::optional<std::string> parent_trace_id_;
    std::optional<std::string> parent_span_id_;
    std::optional<std::string> request_id_;
};

} // namespace loom
