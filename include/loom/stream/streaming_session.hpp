#pragma once

#include "../types.hpp"
#include "../context.hpp"
#include "../partial_json.hpp"
#include "../run_result.hpp"
#include "../run_state.hpp"
#include "event_channel.hpp"
#include "run_event.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

namespace loom {
namespace stream {

// ============================================================================
// Options
// ============================================================================

/**
 * @brief Per-session streaming behavior
 *
 * When approval_handler is set it decides every confirmable tool call
 * synchronously, on the run's thread, and the run never pauses. Without
 * it, a confirmable call pauses the run. Agents configured with
 * auto_approve_tools bypass both.
 */
struct StreamOptions {
    ApprovalHandler approval_handler;     ///< Synchronous approval, optional
    bool parse_partial_json = false;      ///< Emit PartialOutput events for JSON output
    size_t channel_capacity = 0;          ///< Max buffered events (0 = unlimited)
};

// ============================================================================
// StreamingSession
// ============================================================================

/**
 * @brief A run executing on its own thread, observed as an event sequence
 *
 * The caller iterates with next() until it returns nullopt, then reads
 * the final result with result(). A bounded channel makes a slow consumer
 * stall the run rather than buffer without limit.
 *
 * Destroying the session cancels the run and joins the worker thread.
 *
 * @threadsafety next(), result() and cancel() are meant for the owning
 * thread. emit() is called from the worker.
 */
class StreamingSession {
public:
    /** @brief Work executed on the session thread. */
    using Job = std::function<RunResult(StreamingSession& session, const CancelToken& cancel)>;

    StreamingSession(Job job, StreamOptions options)
        : options_(std::move(options))
        , cancel_(CancelToken::create())
        , channel_(options_.channel_capacity)
    {
        worker_ = std::thread([this, job = std::move(job)]() mutable {
            execute(std::move(job));
        });
    }

    ~StreamingSession() {
        cancel_.cancel();
        channel_.close();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    StreamingSession(const StreamingSession&) = delete;
    StreamingSession& operator=(const StreamingSession&) = delete;

    /**
     * @brief Next event in order, blocking until one is available
     *
     * @return The event, or nullopt once the run finished and all events were consumed
     */
    std::optional<RunEvent> next() {
        return channel_.pop();
    }

    template<typename Rep, typename Period>
    std::optional<RunEvent> next_for(const std::chrono::duration<Rep, Period>& timeout) {
        return channel_.pop_for(timeout);
    }

    /**
     * @brief Wait for the run to finish and return its result
     *
     * Events not consumed yet are discarded.
     */
    RunResult result() {
        while (channel_.pop()) {
        }
        if (worker_.joinable()) {
            worker_.join();
        }
        std::lock_guard<std::mutex> lock(result_mutex_);
        return *result_;
    }

    /** @brief Ask the run to stop before its next model or tool call. */
    void cancel() {
        cancel_.cancel();
    }

    bool is_finished() const {
        return finished_.load(std::memory_order_acquire);
    }

    const StreamOptions& options() const { return options_; }

    /**
     * @brief Publish an event to the consumer
     *
     * With parse_partial_json enabled, text deltas also feed the partial
     * parser and a PartialOutput follows whenever the decoded value changes.
     * A TurnStarted resets the parser. Events are dropped once the session
     * is being destroyed.
     */
    void emit(RunEvent event) {
        std::optional<nlohmann::json> partial;
        if (std::holds_alternative<TurnStarted>(event)) {
            reset_partial();
        } else if (options_.parse_partial_json) {
            if (const auto* delta = std::get_if<TextDelta>(&event)) {
                const auto& value = parser_.append(delta->text);
                if (value && value != last_partial_) {
                    last_partial_ = value;
                    partial = value;
                }
            }
        }
        if (!channel_.push(std::move(event))) {
            return;
        }
        if (partial) {
            channel_.push(PartialOutput{std::move(*partial)});
        }
    }

    /** @brief Sink that publishes into this session. Valid while the session lives. */
    EventSink sink() {
        return [this](RunEvent event) { emit(std::move(event)); };
    }

    /** @brief Reset the partial parser, e.g. when a new turn starts streaming. */
    void reset_partial() {
        parser_.reset();
        last_partial_.reset();
    }

private:
    void execute(Job job) {
        std::optional<RunResult> result;
        try {
            result = job(*this, cancel_);
        } catch (const std::exception& e) {
            result = RunResult::failure(Error{ErrorCode::Unknown, std::string("Run aborted: ") + e.what()},
                                        ConversationContext{});
        }

        emit(terminal_event(*result));

        {
            std::lock_guard<std::mutex> lock(result_mutex_);
            result_ = std::move(result);
        }
        finished_.store(true, std::memory_order_release);
        channel_.close();
    }

    StreamOptions options_;
    CancelToken cancel_;
    EventChannel<RunEvent> channel_;
    PartialJsonParser parser_;
    std::optional<nlohmann::json> last_partial_;
    std::mutex result_mutex_;
    std::optional<RunResult> result_;
    std::atomic<bool> finished_{false};
    std::thread worker_;
};

} // namespace stream
} // namespace loom
