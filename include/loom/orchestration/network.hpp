#pragma once

#include "../types.hpp"
#include "../context.hpp"
#include "../interactable.hpp"
#include "../log.hpp"
#include "../run_result.hpp"
#include "parallel.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace loom {
namespace orchestration {

/**
 * @brief One peer's output in one round of a discussion
 */
struct Contribution {
    std::string peer;
    int round = 0;           ///< 1-based round number
    std::string output;      ///< Output text, or the error message when is_error
    bool is_error = false;
};

/**
 * @brief Outcome of AgentNetwork::discuss()
 */
class NetworkResult {
public:
    NetworkResult(std::vector<Contribution> contributions, ConversationContext transcript,
                  std::optional<RunResult> synthesis)
        : contributions_(std::move(contributions))
        , transcript_(std::move(transcript))
        , synthesis_(std::move(synthesis))
    {}

    /** @brief Every contribution, ordered by (round, peer order). */
    const std::vector<Contribution>& contributions() const { return contributions_; }

    /** @brief Shared discussion context after the last round. */
    const ConversationContext& transcript() const { return transcript_; }

    /** @brief Synthesizer result, if a synthesizer is configured. */
    const std::optional<RunResult>& synthesis() const { return synthesis_; }

    std::vector<Contribution> contributions_from(const std::string& peer) const {
        std::vector<Contribution> out;
        for (const auto& c : contributions_) {
            if (c.peer == peer) {
                out.push_back(c);
            }
        }
        return out;
    }

    std::vector<Contribution> contributions_from_round(int round) const {
        std::vector<Contribution> out;
        for (const auto& c : contributions_) {
            if (c.round == round) {
                out.push_back(c);
            }
        }
        return out;
    }

    std::optional<Contribution> last_contribution() const {
        if (contributions_.empty()) {
            return std::nullopt;
        }
        return contributions_.back();
    }

private:
    std::vector<Contribution> contributions_;
    ConversationContext transcript_;
    std::optional<RunResult> synthesis_;
};

struct NetworkConfig {
    std::string name = "Network";
    std::vector<std::shared_ptr<Interactable>> peers;    ///< At least two peers, in speaking order
    int max_rounds = 2;                                  ///< Rounds of discussion (>= 1)
    std::shared_ptr<Interactable> synthesizer;           ///< Optional, runs once after the last round

    Expected<void> validate() const {
        if (name.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Network name cannot be empty"});
        }
        if (peers.size() < 2) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Network needs at least two peers", name});
        }
        for (const auto& peer : peers) {
            if (!peer) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Network peer cannot be null", name});
            }
        }
        if (max_rounds < 1) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_rounds must be at least 1", name});
        }
        return {};
    }
};

/**
 * @brief Round-based discussion between peers
 *
 * In each round, peers speak one after another. Every peer runs on a fork
 * of the shared discussion context, which already holds the contributions
 * of all earlier rounds and of the peers before it in this round. A
 * successful output is appended to the shared context as an assistant
 * message "[peer]: output".
 */
class AgentNetwork : public Interactable {
public:
    static Expected<std::shared_ptr<AgentNetwork>> create(NetworkConfig config) {
        if (auto result = config.validate(); !result) {
            return tl::unexpected(result.error());
        }
        return std::shared_ptr<AgentNetwork>(new AgentNetwork(std::move(config)));
    }

    const std::string& name() const override { return config_.name; }

    const std::vector<std::shared_ptr<Interactable>>& peers() const { return config_.peers; }

    /**
     * @brief Discuss the conversation in `ctx` for max_rounds rounds
     *
     * `ctx` itself is not modified; the final discussion is available from
     * NetworkResult::transcript(). Stops early when cancelled. With
     * `events`, every peer's and the synthesizer's events are forwarded as
     * MemberEvents.
     */
    NetworkResult discuss(const ConversationContext& ctx, CancelToken cancel = {},
                          const stream::EventSink& events = {}) {
        ConversationContext shared = ctx.copy();
        shared.ensure_trace_context();

        std::vector<Contribution> contributions;
        for (int round = 1; round <= config_.max_rounds && !cancel.is_cancelled(); ++round) {
            for (const auto& peer : config_.peers) {
                if (cancel.is_cancelled()) {
                    break;
                }
                ConversationContext peer_ctx = shared.fork();
                peer_ctx.append(Message::system(role_reminder(peer->name(), round)));

                RunResult result = run_member(*peer, peer_ctx, cancel, events);
                if (result.is_error() || result.is_paused()) {
                    std::string message = result.is_error()
                        ? result.error()->message
                        : "Paused awaiting approval of " + result.paused_state()->pending_tool_call().name;
                    log::get_logger()->error("Network '{}' peer '{}' failed in round {}: {}",
                                             config_.name, peer->name(), round, message);
                    contributions.push_back(Contribution{peer->name(), round, std::move(message), true});
                    continue;
                }

                shared.append(Message::assistant("[" + peer->name() + "]: " + result.output()));
                contributions.push_back(Contribution{peer->name(), round, result.output(), false});
            }
        }

        std::optional<RunResult> synthesis;
        if (config_.synthesizer && !cancel.is_cancelled()) {
            ConversationContext synth_ctx = shared.fork();
            synth_ctx.append(Message::user(synthesis_prompt(shared.last_user_text(), contributions)));
            synthesis = run_member(*config_.synthesizer, synth_ctx, cancel, events);
        }

        return NetworkResult(std::move(contributions), std::move(shared), std::move(synthesis));
    }

    NetworkResult discuss(const std::string& topic, CancelToken cancel = {}) {
        ConversationContext ctx;
        ctx.append(Message::user(topic));
        return discuss(ctx, std::move(cancel));
    }

    /**
     * @brief Send one message to every peer concurrently
     *
     * No rounds and no visibility between peers: this is a parallel group
     * over the peers.
     *
     * @return One result per peer, in peer order
     */
    std::vector<RunResult> broadcast(const std::string& message, CancelToken cancel = {}) {
        ParallelConfig parallel;
        parallel.name = config_.name + "_Broadcast";
        parallel.members = config_.peers;
        // Cannot fail: the peer list was validated by create().
        auto group = ParallelGroup::create(std::move(parallel));
        return (*group)->run_all(message, std::move(cancel));
    }

    using Interactable::run;

    /**
     * @brief Interactable entry point
     *
     * Returns the synthesis when a synthesizer is configured, otherwise
     * the last successful contribution.
     */
    RunResult run(ConversationContext& ctx, CancelToken cancel = {}) override {
        return run_observed(ctx, cancel, {});
    }

    RunResult run_observed(ConversationContext& ctx, const CancelToken& cancel,
                           const stream::EventSink& events) override {
        NetworkResult outcome = discuss(ctx, cancel, events);
        if (outcome.synthesis()) {
            return *outcome.synthesis();
        }
        const auto& contributions = outcome.contributions();
        for (auto it = contributions.rbegin(); it != contributions.rend(); ++it) {
            if (!it->is_error) {
                return RunResult::success(it->output, outcome.transcript());
            }
        }
        if (cancel.is_cancelled()) {
            return RunResult::failure(Error{ErrorCode::RequestCancelled, "Run cancelled", config_.name},
                                      outcome.transcript());
        }
        return RunResult::failure(Error{ErrorCode::MemberFailed, "Every peer failed", config_.name},
                                  outcome.transcript());
    }

    static std::string role_reminder(const std::string& peer, int round) {
        return "You are " + peer + " participating in round " + std::to_string(round) +
               " of a discussion. Consider the previous contributions and add your unique perspective. "
               "Be constructive and build on others' ideas.";
    }

    static std::string synthesis_prompt(const std::string& topic, const std::vector<Contribution>& contributions) {
        std::string prompt = "Discussion topic: " + topic + "\n\nContributions:\n\n";
        for (const auto& c : contributions) {
            if (c.is_error) {
                continue;
            }
            prompt += "**" + c.peer + "** (Round " + std::to_string(c.round) + "): " + c.output + "\n\n";
        }
        prompt += "Synthesize the discussion into a final answer.";
        return prompt;
    }

private:
    explicit AgentNetwork(NetworkConfig config)
        : config_(std::move(config))
    {}

    NetworkConfig config_;
};

} // namespace orchestration
} // namespace loom
