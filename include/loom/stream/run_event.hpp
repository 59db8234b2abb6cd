#pragma once

#include "../types.hpp"
#include "../run_result.hpp"
#include "../run_state.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace loom {
namespace stream {

// ============================================================================
// Events
// ============================================================================

struct TurnStarted {
    int turn;                  ///< 1-based turn number within the run
};

struct TextDelta {
    std::string text;
};

/** @brief Best current decoding of the structured output streamed so far. */
struct PartialOutput {
    nlohmann::json value;
};

/** @brief A tool call is about to be approved or executed. */
struct ToolPending {
    ToolCall call;
};

struct ToolExecuted {
    ToolExecution execution;
};

struct HandoffStarted {
    std::string target;
};

struct Paused {
    PausedRunState state;
};

struct Completed {
    RunResult result;
};

struct Failed {
    Error error;
};

struct MemberEvent;

/**
 * @brief One entry of a run's ordered event stream
 *
 * Every stream ends with exactly one of Paused, Completed or Failed.
 * Events of nested runs arrive wrapped in MemberEvent and never end the
 * stream.
 */
using RunEvent = std::variant<
    TurnStarted,
    TextDelta,
    PartialOutput,
    ToolPending,
    ToolExecuted,
    HandoffStarted,
    Paused,
    Completed,
    Failed,
    MemberEvent
>;

/**
 * @brief An event of a run started on behalf of this one
 *
 * Orchestration members, sub-agent tools and handoff targets report
 * through it. `member` is the name of the Interactable that produced
 * `event`; nesting several levels deep yields nested MemberEvents.
 */
struct MemberEvent {
    std::string member;
    std::shared_ptr<const RunEvent> event;
};

/** @brief Receiver of run events. May be empty. */
using EventSink = std::function<void(RunEvent)>;

/** @brief The event that ends a stream with `result`. */
inline RunEvent terminal_event(const RunResult& result) {
    if (result.is_paused()) {
        return Paused{*result.paused_state()};
    }
    if (result.is_error()) {
        return Failed{*result.error()};
    }
    return Completed{result};
}

/** @brief Wrap `event` as produced by `member`. */
inline MemberEvent tag_member(const std::string& member, RunEvent event) {
    return MemberEvent{member, std::make_shared<const RunEvent>(std::move(event))};
}

} // namespace stream
} // namespace loom
