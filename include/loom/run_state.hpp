#pragma once

#include "types.hpp"
#include "context.hpp"
#include "serialization.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace loom {

class Agent;

/**
 * @brief Snapshot of a run that stopped to wait for approval of a tool call
 *
 * Holds everything needed to continue the run later, possibly in another
 * process: the agent name, the context at the moment of pausing (which
 * already contains the pending tool request), the pending call, the tool
 * calls of the same batch still waiting to run, prior executions and the
 * number of turns used so far.
 *
 * Recording a decision via approve() or reject() is the only mutation a
 * caller can make. A decided state is consumed exactly once by
 * Agent::resume().
 */
class PausedRunState {
public:
    enum class Resolution {
        Undecided,
        Approved,
        Rejected
    };

    PausedRunState(std::string agent_name,
                   ConversationContext context,
                   ToolCall pending_tool_call,
                   std::vector<ToolCall> queued_tool_calls,
                   std::vector<ToolExecution> tool_executions,
                   int turns_used)
        : agent_name_(std::move(agent_name))
        , context_(std::move(context))
        , pending_tool_call_(std::move(pending_tool_call))
        , queued_tool_calls_(std::move(queued_tool_calls))
        , tool_executions_(std::move(tool_executions))
        , turns_used_(turns_used)
    {}

    const std::string& agent_name() const { return agent_name_; }
    const ConversationContext& context() const { return context_; }
    const ToolCall& pending_tool_call() const { return pending_tool_call_; }

    /** @brief Calls from the same model response that follow the pending one. */
    const std::vector<ToolCall>& queued_tool_calls() const { return queued_tool_calls_; }

    const std::vector<ToolExecution>& tool_executions() const { return tool_executions_; }
    int turns_used() const { return turns_used_; }

    Resolution resolution() const { return resolution_; }
    bool is_resolved() const { return resolution_ != Resolution::Undecided; }
    bool is_consumed() const { return consumed_; }

    /** @brief Output supplied with approve(), if any. */
    const std::optional<std::string>& approved_output() const { return approved_output_; }
    const std::string& rejection_reason() const { return rejection_reason_; }

    /**
     * @brief Approve the pending call and let the tool execute on resume.
     *
     * @return InvalidResumeState if a decision was already recorded
     */
    Expected<void> approve() {
        if (auto check = ensure_undecided(); !check) {
            return check;
        }
        resolution_ = Resolution::Approved;
        return {};
    }

    /**
     * @brief Approve the pending call with an externally produced result.
     *
     * The output is recorded as the tool's result without running the tool.
     */
    Expected<void> approve(std::string output) {
        if (auto check = ensure_undecided(); !check) {
            return check;
        }
        resolution_ = Resolution::Approved;
        approved_output_ = std::move(output);
        return {};
    }

    /**
     * @brief Reject the pending call. The reason is shown to the model.
     */
    Expected<void> reject(std::string reason = {}) {
        if (auto check = ensure_undecided(); !check) {
            return check;
        }
        resolution_ = Resolution::Rejected;
        rejection_reason_ = std::move(reason);
        return {};
    }

    // ========================================================================
    // Serialization
    // ========================================================================

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["agent_name"] = agent_name_;
        j["context"] = context_.to_json();
        j["pending_tool_call"] = serialization::encode(pending_tool_call_);
        j["queued_tool_calls"] = nlohmann::json::array();
        for (const auto& call : queued_tool_calls_) {
            j["queued_tool_calls"].push_back(serialization::encode(call));
        }
        j["tool_executions"] = nlohmann::json::array();
        for (const auto& execution : tool_executions_) {
            j["tool_executions"].push_back(serialization::encode(execution));
        }
        j["turns_used"] = turns_used_;

        nlohmann::json resolution;
        switch (resolution_) {
            case Resolution::Undecided:
                resolution["status"] = "undecided";
                break;
            case Resolution::Approved:
                resolution["status"] = "approved";
                if (approved_output_) {
                    resolution["output"] = *approved_output_;
                }
                break;
            case Resolution::Rejected:
                resolution["status"] = "rejected";
                resolution["reason"] = rejection_reason_;
                break;
        }
        j["resolution"] = resolution;
        return j;
    }

    /**
     * @brief Restore a state produced by to_json().
     *
     * The restored state can be resumed once, regardless of whether the
     * original instance was already resumed.
     *
     * @return InvalidRunState if the document is malformed
     */
    static Expected<PausedRunState> from_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            return tl::unexpected(Error{ErrorCode::InvalidRunState, "Run state must be a JSON object"});
        }
        try {
            auto context = ConversationContext::from_json(j.at("context"));
            if (!context) {
                return tl::unexpected(context.error());
            }
            auto pending = serialization::decode_tool_call(j.at("pending_tool_call"));
            if (!pending) {
                return tl::unexpected(pending.error());
            }

            std::vector<ToolCall> queued;
            if (auto it = j.find("queued_tool_calls"); it != j.end()) {
                for (const auto& item : *it) {
                    auto call = serialization::decode_tool_call(item);
                    if (!call) {
                        return tl::unexpected(call.error());
                    }
                    queued.push_back(std::move(*call));
                }
            }

            std::vector<ToolExecution> executions;
            for (const auto& item : j.at("tool_executions")) {
                auto execution = serialization::decode_tool_execution(item);
                if (!execution) {
                    return tl::unexpected(execution.error());
                }
                executions.push_back(std::move(*execution));
            }

            PausedRunState state(j.at("agent_name").get<std::string>(),
                                 std::move(*context),
                                 std::move(*pending),
                                 std::move(queued),
                                 std::move(executions),
                                 j.at("turns_used").get<int>());

            if (auto it = j.find("resolution"); it != j.end()) {
                const auto status = it->at("status").get<std::string>();
                if (status == "approved") {
                    state.resolution_ = Resolution::Approved;
                    if (auto out = it->find("output"); out != it->end()) {
                        state.approved_output_ = out->get<std::string>();
                    }
                } else if (status == "rejected") {
                    state.resolution_ = Resolution::Rejected;
                    state.rejection_reason_ = it->value("reason", std::string{});
                } else if (status != "undecided") {
                    return tl::unexpected(Error{ErrorCode::InvalidRunState, "Unknown resolution status: " + status});
                }
            }
            return state;
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{ErrorCode::InvalidRunState, "Malformed run state", std::string(e.what())});
        }
    }

private:
    friend class Agent;

    Expected<void> ensure_undecided() const {
        if (resolution_ != Resolution::Undecided) {
            return tl::unexpected(Error{
                ErrorCode::InvalidResumeState,
                "A decision was already recorded for tool call " + pending_tool_call_.call_id
            });
        }
        return {};
    }

    std::string agent_name_;
    ConversationContext context_;
    ToolCall pending_tool_call_;
    std::vector<ToolCall> queued_tool_calls_;
    std::vector<ToolExecution> tool_executions_;
    int turns_used_ = 0;

    Resolution resolution_ = Resolution::Undecided;
    std::optional<std::string> approved_output_;
    std::string rejection_reason_;
    bool consumed_ = false;
};

} // namespace loom
