#pragma once

#include "../types.hpp"
#include "../context.hpp"
#include "../interactable.hpp"
#include "../log.hpp"
#include "../run_result.hpp"
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace loom {
namespace orchestration {

/**
 * @brief Configuration of a fan-out/fan-in group
 */
struct ParallelConfig {
    std::string name = "Parallel";                              ///< Group name
    std::vector<std::shared_ptr<Interactable>> members;         ///< At least one member
    std::shared_ptr<Interactable> synthesizer;                  ///< Used by run() when set

    Expected<void> validate() const {
        if (name.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Parallel group name cannot be empty"});
        }
        if (members.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Parallel group needs at least one member", name});
        }
        for (const auto& member : members) {
            if (!member) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Parallel member cannot be null", name});
            }
        }
        return {};
    }
};

/**
 * @brief Runs independent members concurrently against forks of one context
 *
 * Every member gets its own fork of the caller's context, so members never
 * observe each other. Each member runs on its own thread.
 */
class ParallelGroup : public Interactable {
public:
    static Expected<std::shared_ptr<ParallelGroup>> create(ParallelConfig config) {
        if (auto result = config.validate(); !result) {
            return tl::unexpected(result.error());
        }
        return std::shared_ptr<ParallelGroup>(new ParallelGroup(std::move(config)));
    }

    const std::string& name() const override { return config_.name; }

    const std::vector<std::shared_ptr<Interactable>>& members() const { return config_.members; }

    /**
     * @brief Run every member and wait for all of them
     *
     * A failing member does not affect the others. With `events`, each
     * member's events are forwarded as MemberEvents, one at a time.
     *
     * @return One result per member, in member order
     */
    std::vector<RunResult> run_all(const ConversationContext& ctx, CancelToken cancel = {},
                                   const stream::EventSink& events = {}) {
        ConversationContext base = ctx.copy();
        base.ensure_trace_context();

        std::mutex sink_mutex;
        stream::EventSink member_events = serialized(events, sink_mutex);

        std::vector<std::future<RunResult>> futures;
        futures.reserve(config_.members.size());
        for (const auto& member : config_.members) {
            futures.push_back(std::async(std::launch::async,
                [member, forked = base.fork(), cancel, &member_events]() mutable {
                    return run_member(*member, forked, cancel, member_events);
                }));
        }

        std::vector<RunResult> results;
        results.reserve(futures.size());
        for (size_t i = 0; i < futures.size(); ++i) {
            results.push_back(futures[i].get());
            if (results.back().is_error()) {
                log::get_logger()->error("Parallel '{}' member '{}' failed: {}", config_.name,
                                         config_.members[i]->name(), results.back().error()->to_string());
            }
        }
        return results;
    }

    std::vector<RunResult> run_all(const std::string& input, CancelToken cancel = {}) {
        return run_all(user_context(input), std::move(cancel));
    }

    /**
     * @brief Run every member and return whichever finishes first
     *
     * The first result (success or error) wins and the remaining members
     * are cancelled; they start no further model or tool calls once they
     * observe it, including calls made inside runs they delegated to.
     * Returns after every member has stopped.
     */
    RunResult run_first(const ConversationContext& ctx, CancelToken cancel = {},
                        const stream::EventSink& events = {}) {
        ConversationContext base = ctx.copy();
        base.ensure_trace_context();

        CancelToken race = cancel.child();
        std::mutex mutex;
        std::optional<RunResult> winner;

        std::mutex sink_mutex;
        stream::EventSink member_events = serialized(events, sink_mutex);

        std::vector<std::future<void>> futures;
        futures.reserve(config_.members.size());
        for (const auto& member : config_.members) {
            futures.push_back(std::async(std::launch::async,
                [member, forked = base.fork(), race, &mutex, &winner, &member_events]() mutable {
                    RunResult result = run_member(*member, forked, race, member_events);
                    std::lock_guard<std::mutex> lock(mutex);
                    if (!winner) {
                        winner = std::move(result);
                        race.cancel();
                    }
                }));
        }
        for (auto& future : futures) {
            future.get();
        }
        return std::move(*winner);
    }

    RunResult run_first(const std::string& input, CancelToken cancel = {}) {
        return run_first(user_context(input), std::move(cancel));
    }

    /**
     * @brief Run every member, then have `synthesizer` combine their outputs
     *
     * The synthesizer runs on a fresh context under the same trace, seeded
     * with the original query and every member's output. Its result is
     * returned with all member results attached as related results.
     */
    RunResult run_and_synthesize(const ConversationContext& ctx, const std::shared_ptr<Interactable>& synthesizer,
                                 CancelToken cancel = {}, const stream::EventSink& events = {}) {
        ConversationContext base = ctx.copy();
        base.ensure_trace_context();

        auto results = run_all(base, cancel, events);

        ConversationContext synth_ctx = base.fork_trace_only();
        synth_ctx.append(Message::user(synthesis_prompt(base.last_user_text(), results)));
        RunResult synthesized = run_member(*synthesizer, synth_ctx, cancel, events);
        return RunResult::composite(std::move(synthesized), std::move(results));
    }

    using Interactable::run;

    /**
     * @brief Interactable entry point
     *
     * Synthesizes when a synthesizer is configured; otherwise returns the
     * first member's result with the others attached as related results.
     */
    RunResult run(ConversationContext& ctx, CancelToken cancel = {}) override {
        return run_observed(ctx, cancel, {});
    }

    /** @brief As run(), forwarding member and synthesizer events as MemberEvents. */
    RunResult run_observed(ConversationContext& ctx, const CancelToken& cancel,
                           const stream::EventSink& events) override {
        if (config_.synthesizer) {
            return run_and_synthesize(ctx, config_.synthesizer, cancel, events);
        }
        auto results = run_all(ctx, cancel, events);
        RunResult primary = std::move(results.front());
        results.erase(results.begin());
        return RunResult::composite(std::move(primary), std::move(results));
    }

    /** @brief Text handed to the synthesizer. */
    std::string synthesis_prompt(const std::string& query, const std::vector<RunResult>& results) const {
        std::string prompt = "Original query: " + query + "\n\n";
        prompt += "The following participants have provided their outputs:\n\n";
        for (size_t i = 0; i < results.size() && i < config_.members.size(); ++i) {
            prompt += "--- " + config_.members[i]->name() + " ---\n";
            prompt += results[i].output_or_error() + "\n\n";
        }
        prompt += "Please synthesize these outputs into a coherent response.";
        return prompt;
    }

private:
    explicit ParallelGroup(ParallelConfig config)
        : config_(std::move(config))
    {}

    /** Sink that lets concurrent members share `events`. Empty when `events` is. */
    static stream::EventSink serialized(const stream::EventSink& events, std::mutex& mutex) {
        if (!events) {
            return {};
        }
        return [&events, &mutex](stream::RunEvent event) {
            std::lock_guard<std::mutex> lock(mutex);
            events(std::move(event));
        };
    }

    static ConversationContext user_context(const std::string& input) {
        ConversationContext ctx;
        ctx.append(Message::user(input));
        return ctx;
    }

    ParallelConfig config_;
};

} // namespace orchestration
} // namespace loom
