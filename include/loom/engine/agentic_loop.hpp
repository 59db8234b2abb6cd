#pragma once

#include "../types.hpp"
#include "../agent_config.hpp"
#include "../context.hpp"
#include "../log.hpp"
#include "../run_result.hpp"
#include "../run_state.hpp"
#include "../backend/ITransport.hpp"
#include "argument_validator.hpp"
#include "guardrail.hpp"
#include "tool_registry.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace loom {
namespace engine {

/**
 * @brief Observers and policies supplied by the caller of one run
 *
 * All callbacks fire on the run's own thread, in order. A slow callback
 * stalls this run only.
 */
struct LoopHooks {
    std::function<void(int turn)> on_turn_start;
    std::function<void(const std::string& text)> on_text_delta;
    std::function<void(const ToolCall&)> on_tool_pending;
    std::function<void(const ToolExecution&)> on_tool_executed;
    std::function<void(const std::string& target)> on_handoff;
    ApprovalHandler approval_handler;   ///< Decides confirmable calls instead of pausing
    stream::EventSink delegated_events; ///< Receives events of runs started by tools and handoffs
    bool streaming = false;             ///< Use ITransport::stream() instead of send()
};

/**
 * @brief Turn-based execution state machine of a single agent
 *
 * Each iteration:
 * 1. Stop if cancelled or if the turn budget is used up
 * 2. Call the transport with the context, trimmed by the context window
 *    strategy when one is configured
 * 3. Run output guardrails against the text (first failure ends the run)
 * 4. No tool calls: done. A handoff call: transfer and end the run.
 * 5. Otherwise resolve and execute every call in order, appending the
 *    request and result entries with their correlation id. A confirmable
 *    call without auto-approval is decided by the approval handler, or
 *    pauses the run when there is none.
 *
 * Unknown tools, undecodable or invalid arguments and failing handlers
 * produce failed ToolExecutions; the model sees the failure and the loop
 * continues.
 *
 * @threadsafety run() and resume() are const and may execute concurrently
 * on different contexts.
 */
class AgenticLoop {
public:
    AgenticLoop(std::shared_ptr<backend::ITransport> transport, AgentConfig config)
        : transport_(std::move(transport))
        , config_(std::move(config))
    {}

    const AgentConfig& config() const { return config_; }

    /**
     * @brief Run from the current state of `ctx`
     *
     * Input guardrails are checked against the latest user message before
     * any model call.
     */
    RunResult run(ConversationContext& ctx, const CancelToken& cancel, const LoopHooks& hooks) const {
        Progress progress;
        progress.turn_base = ctx.turn_count();

        if (auto failure = first_failure(config_.input_guardrails, ctx.last_user_text(), ctx)) {
            log::get_logger()->warn("Agent '{}' input rejected: {}", config_.name, failure->reason);
            return finish_error(Error{ErrorCode::InputRejected, failure->reason, config_.name}, ctx, progress);
        }

        return iterate(ctx, progress, cancel, hooks);
    }

    /**
     * @brief Continue a paused run whose decision has been recorded
     *
     * The caller has already checked that the state is resolved, unconsumed
     * and belongs to this agent.
     */
    RunResult resume(const PausedRunState& state, const CancelToken& cancel, const LoopHooks& hooks) const {
        ConversationContext ctx = state.context();
        Progress progress;
        progress.executions = state.tool_executions();
        progress.turn_base = ctx.turn_count() - state.turns_used();

        const ToolCall& call = state.pending_tool_call();
        if (state.resolution() == PausedRunState::Resolution::Rejected) {
            record(ctx, progress, rejected_execution(call, state.rejection_reason()), hooks);
        } else if (state.approved_output()) {
            ToolExecution execution{call.name, call.call_id, call.arguments,
                                    *state.approved_output(), true, std::chrono::milliseconds(0)};
            record(ctx, progress, std::move(execution), hooks);
        } else {
            record(ctx, progress, execute(call, ctx, cancel, hooks), hooks);
        }

        if (auto stop = process_calls(ctx, progress, state.queued_tool_calls(), cancel, hooks)) {
            return std::move(*stop);
        }
        return iterate(ctx, progress, cancel, hooks);
    }

    /** @brief Tool schemas offered to the model: registered tools, then handoffs. */
    nlohmann::json tool_schemas() const {
        nlohmann::json schemas = config_.tools ? config_.tools->get_all_schemas() : nlohmann::json::array();
        for (const auto& handoff : config_.handoffs) {
            schemas.push_back(handoff.tool_schema());
        }
        return schemas;
    }

private:
    /** State of one invocation that is not part of the context. */
    struct Progress {
        std::vector<ToolExecution> executions;
        int turn_base = 0;
        TokenUsage usage;
    };

    int turns_used(const ConversationContext& ctx, const Progress& progress) const {
        return ctx.turn_count() - progress.turn_base;
    }

    RunResult iterate(ConversationContext& ctx, Progress& progress,
                      const CancelToken& cancel, const LoopHooks& hooks) const {
        auto logger = log::get_logger();

        while (true) {
            if (cancel.is_cancelled()) {
                return finish_error(Error{ErrorCode::RequestCancelled, "Run cancelled", config_.name}, ctx, progress);
            }

            const int used = turns_used(ctx, progress);
            if (used >= config_.max_turns) {
                return finish_error(Error{
                    ErrorCode::TurnLimitExceeded,
                    "Exceeded maximum turns: " + std::to_string(config_.max_turns),
                    config_.name
                }, ctx, progress);
            }

            ctx.increment_turn();
            logger->debug("Agent '{}' turn {}", config_.name, used + 1);
            if (hooks.on_turn_start) {
                hooks.on_turn_start(used + 1);
            }

            auto request = build_request(ctx);
            Expected<backend::ModelResponse> response = hooks.streaming
                ? transport_->stream(request, [&hooks](const backend::TransportEvent& event) {
                      if (event.type == backend::TransportEventType::TextDelta && hooks.on_text_delta) {
                          hooks.on_text_delta(event.text);
                      }
                  })
                : transport_->send(request);

            if (!response) {
                logger->warn("Agent '{}' transport failure: {}", config_.name, response.error().to_string());
                return finish_error(Error{
                    ErrorCode::TransportFailure,
                    response.error().message,
                    config_.name
                }, ctx, progress);
            }
            progress.usage += response->usage;

            const std::string& text = response->text;
            if (!text.empty() || response->tool_calls.empty()) {
                if (auto failure = first_failure(config_.output_guardrails, text, ctx)) {
                    logger->warn("Agent '{}' output rejected: {}", config_.name, failure->reason);
                    return finish_error(Error{ErrorCode::OutputRejected, failure->reason, config_.name},
                                        ctx, progress);
                }
            }

            if (!text.empty()) {
                ctx.append(Message::assistant(text));
            }

            if (response->tool_calls.empty()) {
                auto result = RunResult::success(text, ctx, progress.executions, turns_used(ctx, progress));
                result.set_usage(progress.usage);
                return result;
            }

            if (auto stop = process_calls(ctx, progress, response->tool_calls, cancel, hooks)) {
                return std::move(*stop);
            }
        }
    }

    /**
     * @brief Handle a batch of tool calls in order
     *
     * @return A result when the run must stop here (pause, handoff,
     *         cancellation), nullopt to continue with the next turn
     */
    std::optional<RunResult> process_calls(ConversationContext& ctx, Progress& progress,
                                           const std::vector<ToolCall>& calls,
                                           const CancelToken& cancel, const LoopHooks& hooks) const {
        for (size_t i = 0; i < calls.size(); ++i) {
            const ToolCall& call = calls[i];

            if (cancel.is_cancelled()) {
                return finish_error(Error{ErrorCode::RequestCancelled, "Run cancelled", config_.name}, ctx, progress);
            }

            if (const Handoff* handoff = find_handoff(call.name)) {
                return perform_handoff(ctx, progress, *handoff, call, cancel, hooks);
            }

            ctx.append(Message::tool_call(call));
            if (hooks.on_tool_pending) {
                hooks.on_tool_pending(call);
            }

            const bool needs_approval = !config_.auto_approve_tools && config_.tools &&
                                        config_.tools->requires_confirmation(call.name);
            if (needs_approval) {
                if (hooks.approval_handler) {
                    auto decision = hooks.approval_handler(call);
                    if (!decision.approved) {
                        record(ctx, progress, rejected_execution(call, decision.reason), hooks);
                        continue;
                    }
                } else {
                    std::vector<ToolCall> queued(calls.begin() + static_cast<std::ptrdiff_t>(i) + 1, calls.end());
                    log::get_logger()->info("Agent '{}' paused for approval of '{}' ({})",
                                            config_.name, call.name, call.call_id);
                    PausedRunState state(config_.name, ctx, call, std::move(queued),
                                         progress.executions, turns_used(ctx, progress));
                    auto result = RunResult::paused(std::move(state));
                    result.set_usage(progress.usage);
                    return result;
                }
            }

            record(ctx, progress, execute(call, ctx, cancel, hooks), hooks);
        }
        return std::nullopt;
    }

    /** @brief Resolve, validate and run one tool call. Never fails the run. */
    ToolExecution execute(const ToolCall& call, const ConversationContext& ctx,
                          const CancelToken& cancel, const LoopHooks& hooks) const {
        const auto start = std::chrono::steady_clock::now();
        ToolExecution execution{call.name, call.call_id, call.arguments, {}, false, std::chrono::milliseconds(0)};

        auto fail = [&](const std::string& reason) {
            execution.success = false;
            execution.output = "Tool execution failed: " + reason;
        };

        std::optional<ToolEntry> entry;
        if (config_.tools) {
            entry = config_.tools->find(call.name);
        }

        if (!entry) {
            fail("Tool not found: " + call.name);
        } else {
            auto args = call.arguments.empty()
                ? nlohmann::json::object()
                : nlohmann::json::parse(call.arguments, nullptr, false);
            if (args.is_discarded()) {
                fail("Invalid JSON arguments for " + call.name);
            } else if (auto problem = ArgumentValidator::validate(args, entry->parameters_schema); !problem.empty()) {
                fail(problem);
            } else {
                auto result = ToolRegistry::invoke_entry(*entry, args,
                                                         ToolContext{ctx, cancel, hooks.delegated_events});
                if (result) {
                    execution.success = true;
                    execution.output = result->is_string() ? result->get<std::string>() : result->dump();
                } else {
                    fail(result.error().message);
                }
            }
        }

        execution.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        log::get_logger()->debug("Agent '{}' tool '{}' {} in {} ms", config_.name, call.name,
                                 execution.success ? "succeeded" : "failed", execution.latency.count());
        return execution;
    }

    static ToolExecution rejected_execution(const ToolCall& call, const std::string& reason) {
        std::string output = "Tool execution was rejected";
        if (!reason.empty()) {
            output += ": " + reason;
        }
        return ToolExecution{call.name, call.call_id, call.arguments, std::move(output), false,
                             std::chrono::milliseconds(0)};
    }

    /** @brief Append the result entry and record the execution. */
    static void record(ConversationContext& ctx, Progress& progress, ToolExecution execution,
                       const LoopHooks& hooks) {
        ctx.append(Message::tool_result(execution.call_id, execution.tool_name, execution.output));
        if (hooks.on_tool_executed) {
            hooks.on_tool_executed(execution);
        }
        progress.executions.push_back(std::move(execution));
    }

    const Handoff* find_handoff(const std::string& tool_name) const {
        for (const auto& handoff : config_.handoffs) {
            if (handoff.tool_name() == tool_name) {
                return &handoff;
            }
        }
        return nullptr;
    }

    RunResult perform_handoff(ConversationContext& ctx, Progress& progress, const Handoff& handoff,
                              const ToolCall& call, const CancelToken& cancel, const LoopHooks& hooks) const {
        const std::string& target_name = handoff.target->name();
        log::get_logger()->info("Agent '{}' handing off to '{}'", config_.name, target_name);

        ctx.append(Message::tool_call(call));
        ctx.append(Message::tool_result(call.call_id, call.name, "Transferred to " + target_name));
        if (hooks.on_handoff) {
            hooks.on_handoff(target_name);
        }

        std::string message;
        auto args = nlohmann::json::parse(call.arguments.empty() ? std::string("{}") : call.arguments,
                                          nullptr, false);
        if (args.is_object()) {
            if (auto it = args.find("message"); it != args.end() && it->is_string()) {
                message = it->get<std::string>();
            }
        }
        if (message.empty()) {
            message = ctx.last_user_text();
        }

        ConversationContext child = ctx.fork();
        if (!message.empty()) {
            child.append(Message::user(message));
        }

        RunResult target_result = run_member(*handoff.target, child, cancel, hooks.delegated_events);
        if (target_result.is_paused()) {
            return target_result;
        }
        if (target_result.is_error()) {
            log::get_logger()->error("Agent '{}' handoff to '{}' failed: {}", config_.name, target_name,
                                     target_result.error()->to_string());
            return finish_error(Error{
                ErrorCode::HandoffFailed,
                "Handoff to '" + target_name + "' failed: " + target_result.error()->message,
                config_.name
            }, ctx, progress);
        }

        auto result = RunResult::handoff(target_name, std::move(target_result), ctx,
                                         progress.executions, turns_used(ctx, progress));
        result.set_usage(progress.usage);
        return result;
    }

    backend::ModelRequest build_request(const ConversationContext& ctx) const {
        backend::ModelRequest request;
        request.model = config_.model;
        request.instructions = config_.instructions;
        request.messages = config_.context_window ? config_.context_window->apply(ctx.history()) : ctx.history();
        request.tools = tool_schemas();
        request.temperature = config_.temperature;
        request.trace_id = ctx.parent_trace_id();
        request.span_id = ctx.parent_span_id();
        return request;
    }

    RunResult finish_error(Error error, const ConversationContext& ctx, const Progress& progress) const {
        auto result = RunResult::failure(std::move(error), ctx, progress.executions, turns_used(ctx, progress));
        result.set_usage(progress.usage);
        return result;
    }

    std::shared_ptr<backend::ITransport> transport_;
    AgentConfig config_;
};

} // namespace engine
} // namespace loom
