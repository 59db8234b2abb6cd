#pragma once

#include "types.hpp"
#include "context.hpp"
#include "run_state.hpp"
#include <optional>
#include <string>
#include <vector>

namespace loom {

/**
 * @brief Terminal outcome of one run
 *
 * Exactly one of success, handoff, error or paused, plus the context
 * snapshot at the end of the run, the tool executions it performed and
 * the number of turns it used. Always check status() before reading
 * output().
 *
 * A composite result is a primary result plus related results, used by
 * orchestration to keep every member's outcome.
 */
class RunResult {
public:
    enum class Status {
        Success,
        Handoff,
        Error,
        Paused
    };

    // ========================================================================
    // Factories
    // ========================================================================

    static RunResult success(std::string output, ConversationContext context,
                             std::vector<ToolExecution> executions = {}, int turns_used = 0) {
        RunResult r(Status::Success, std::move(context), std::move(executions), turns_used);
        r.output_ = std::move(output);
        return r;
    }

    /**
     * @brief Control was transferred to another agent, which produced `target_result`.
     *
     * The output is the target's output; the target's result is kept as the
     * first related result.
     */
    static RunResult handoff(std::string target, RunResult target_result, ConversationContext context,
                             std::vector<ToolExecution> executions = {}, int turns_used = 0) {
        RunResult r(Status::Handoff, std::move(context), std::move(executions), turns_used);
        r.output_ = target_result.output();
        r.handoff_agent_ = std::move(target);
        r.related_.push_back(std::move(target_result));
        return r;
    }

    static RunResult failure(Error error, ConversationContext context,
                             std::vector<ToolExecution> executions = {}, int turns_used = 0) {
        RunResult r(Status::Error, std::move(context), std::move(executions), turns_used);
        r.error_ = std::move(error);
        return r;
    }

    static RunResult paused(PausedRunState state) {
        RunResult r(Status::Paused, state.context(), state.tool_executions(), state.turns_used());
        r.paused_state_ = std::move(state);
        return r;
    }

    /** @brief Primary result carrying the others as related results. */
    static RunResult composite(RunResult primary, std::vector<RunResult> related) {
        for (auto& r : related) {
            primary.related_.push_back(std::move(r));
        }
        return primary;
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    Status status() const { return status_; }
    bool is_success() const { return status_ == Status::Success; }
    bool is_handoff() const { return status_ == Status::Handoff; }
    bool is_error() const { return status_ == Status::Error; }
    bool is_paused() const { return status_ == Status::Paused; }

    /** @brief Final text (success and handoff only). */
    const std::string& output() const { return output_; }

    const std::optional<Error>& error() const { return error_; }

    /** @brief Name of the agent that took over (handoff only). */
    const std::optional<std::string>& handoff_agent() const { return handoff_agent_; }

    const std::optional<PausedRunState>& paused_state() const { return paused_state_; }
    std::optional<PausedRunState>& paused_state() { return paused_state_; }

    const ConversationContext& context() const { return context_; }
    const std::vector<ToolExecution>& tool_executions() const { return tool_executions_; }
    int turns_used() const { return turns_used_; }

    const TokenUsage& usage() const { return usage_; }
    void set_usage(TokenUsage usage) { usage_ = usage; }

    const std::vector<RunResult>& related() const { return related_; }
    bool is_composite() const { return !related_.empty(); }

    /** @brief Output text, or "[ERROR: message]" for a failed result. */
    std::string output_or_error() const {
        if (error_) {
            return "[ERROR: " + error_->message + "]";
        }
        return output_;
    }

private:
    RunResult(Status status, ConversationContext context,
              std::vector<ToolExecution> executions, int turns_used)
        : status_(status)
        , context_(std::move(context))
        , tool_executions_(std::move(executions))
        , turns_used_(turns_used)
    {}

    Status status_;
    std::string output_;
    std::optional<Error> error_;
    std::optional<std::string> handoff_agent_;
    std::optional<PausedRunState> paused_state_;
    ConversationContext context_;
    std::vector<ToolExecution> tool_executions_;
    int turns_used_ = 0;
    TokenUsage usage_;
    std::vector<RunResult> related_;
};

} // namespace loom
