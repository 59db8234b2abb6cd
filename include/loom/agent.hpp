#pragma once

#include "types.hpp"
#include "agent_config.hpp"
#include "context.hpp"
#include "interactable.hpp"
#include "run_result.hpp"
#include "run_state.hpp"
#include "backend/ITransport.hpp"
#include "engine/agentic_loop.hpp"
#include "stream/streaming_session.hpp"
#include <memory>
#include <string>

namespace loom {

/**
 * @brief An LLM-backed agent: configuration plus a transport
 *
 * Agents hold no per-run state. Every run operates on a caller-supplied
 * ConversationContext, so one agent may serve many runs concurrently.
 *
 * Example:
 * @code
 * AgentConfig config;
 * config.name = "Assistant";
 * config.model = "gpt-4o";
 * auto agent = Agent::create(config, transport);
 * if (!agent) { handle(agent.error()); }
 *
 * auto result = (*agent)->run("Summarize the report");
 * if (result.is_paused()) {
 *     auto& state = *result.paused_state();
 *     state.approve();
 *     result = *(*agent)->resume(state);
 * }
 * @endcode
 */
class Agent : public Interactable {
public:
    /**
     * @brief Validate the configuration and create an agent
     *
     * @return InvalidConfig if the configuration is invalid or the transport is null
     */
    static Expected<std::shared_ptr<Agent>> create(AgentConfig config,
                                                   std::shared_ptr<backend::ITransport> transport) {
        if (auto result = config.validate(); !result) {
            return tl::unexpected(result.error());
        }
        if (!transport) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Transport cannot be null", config.name});
        }
        return std::shared_ptr<Agent>(new Agent(std::move(transport), std::move(config)));
    }

    const std::string& name() const override { return loop_.config().name; }

    const AgentConfig& config() const { return loop_.config(); }

    using Interactable::run;

    /**
     * @brief Run the agentic loop on `ctx`
     *
     * Confirmable tools pause the run unless auto_approve_tools is set.
     */
    RunResult run(ConversationContext& ctx, CancelToken cancel = {}) override {
        return loop_.run(ctx, cancel, engine::LoopHooks{});
    }

    /**
     * @brief Run with a synchronous approval handler
     *
     * The handler decides every confirmable tool call, so the run never
     * pauses.
     */
    RunResult run(ConversationContext& ctx, CancelToken cancel, ApprovalHandler approval_handler) {
        engine::LoopHooks hooks;
        hooks.approval_handler = std::move(approval_handler);
        return loop_.run(ctx, cancel, hooks);
    }

    /**
     * @brief Continue a paused run after a decision was recorded
     *
     * Turn count, history and tool executions continue from the snapshot;
     * the final result has the same shape as a run that never paused.
     *
     * @return InvalidResumeState if the state is undecided, was already
     *         resumed, or belongs to another agent
     */
    Expected<RunResult> resume(PausedRunState& state, CancelToken cancel = {}) {
        if (auto check = check_resumable(state); !check) {
            return tl::unexpected(check.error());
        }
        state.consumed_ = true;
        return loop_.resume(state, cancel, engine::LoopHooks{});
    }

    /**
     * @brief Run with streamed model output, reporting every step to `events`
     *
     * Tools and handoff targets that start runs of their own report them
     * as MemberEvents. Confirmable tools pause the run as in run().
     */
    RunResult run_observed(ConversationContext& ctx, const CancelToken& cancel,
                           const stream::EventSink& events) override {
        if (!events) {
            return run(ctx, cancel);
        }
        return loop_.run(ctx, cancel, event_hooks(events, nullptr));
    }

    std::unique_ptr<stream::StreamingSession> run_streaming(ConversationContext ctx,
                                                            stream::StreamOptions options = {}) override {
        auto self = std::static_pointer_cast<Agent>(shared_from_this());
        return std::make_unique<stream::StreamingSession>(
            [self, ctx = std::move(ctx)](stream::StreamingSession& session, const CancelToken& cancel) mutable {
                return self->loop_.run(ctx, cancel, event_hooks(session.sink(), session.options().approval_handler));
            },
            std::move(options));
    }

    /**
     * @brief Resume a paused run as an event stream
     *
     * The state is validated and consumed before the session starts.
     */
    Expected<std::unique_ptr<stream::StreamingSession>> resume_streaming(PausedRunState& state,
                                                                         stream::StreamOptions options = {}) {
        if (auto check = check_resumable(state); !check) {
            return tl::unexpected(check.error());
        }
        state.consumed_ = true;
        auto self = std::static_pointer_cast<Agent>(shared_from_this());
        return std::make_unique<stream::StreamingSession>(
            [self, snapshot = state](stream::StreamingSession& session, const CancelToken& cancel) {
                return self->loop_.resume(snapshot, cancel,
                                          event_hooks(session.sink(), session.options().approval_handler));
            },
            std::move(options));
    }

private:
    Agent(std::shared_ptr<backend::ITransport> transport, AgentConfig config)
        : loop_(std::move(transport), std::move(config))
    {}

    Expected<void> check_resumable(const PausedRunState& state) const {
        if (state.agent_name() != name()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidResumeState,
                "Run state belongs to agent '" + state.agent_name() + "'",
                name()
            });
        }
        if (!state.is_resolved()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidResumeState,
                "No decision recorded for tool call " + state.pending_tool_call().call_id,
                name()
            });
        }
        if (state.is_consumed()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidResumeState,
                "Run state was already resumed",
                name()
            });
        }
        return {};
    }

    static engine::LoopHooks event_hooks(stream::EventSink events, ApprovalHandler approval_handler) {
        engine::LoopHooks hooks;
        hooks.streaming = true;
        hooks.approval_handler = std::move(approval_handler);
        hooks.on_turn_start = [events](int turn) {
            events(stream::TurnStarted{turn});
        };
        hooks.on_text_delta = [events](const std::string& text) {
            events(stream::TextDelta{text});
        };
        hooks.on_tool_pending = [events](const ToolCall& call) {
            events(stream::ToolPending{call});
        };
        hooks.on_tool_executed = [events](const ToolExecution& execution) {
            events(stream::ToolExecuted{execution});
        };
        hooks.on_handoff = [events](const std::string& target) {
            events(stream::HandoffStarted{target});
        };
        hooks.delegated_events = std::move(events);
        return hooks;
    }

    engine::AgenticLoop loop_;
};

} // namespace loom
