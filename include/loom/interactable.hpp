#pragma once

#include "types.hpp"
#include "context.hpp"
#include "run_result.hpp"
#include "stream/streaming_session.hpp"
#include <memory>
#include <string>

namespace loom {

/**
 * @brief Common run contract of agents and orchestration primitives
 *
 * Orchestration primitives only depend on this interface, so routers,
 * parallel groups and networks can be nested as members of one another.
 * Instances are created by factories that return std::shared_ptr.
 *
 * Derived classes that override run(ctx, cancel) should add
 * `using Interactable::run;` to keep the convenience overload visible.
 */
class Interactable : public std::enable_shared_from_this<Interactable> {
public:
    virtual ~Interactable() = default;

    virtual const std::string& name() const = 0;

    /**
     * @brief Run to completion against a caller-owned context
     *
     * The context is updated in place with everything the run appends.
     *
     * @param ctx Conversation to continue
     * @param cancel Token checked before every model and tool call
     */
    virtual RunResult run(ConversationContext& ctx, CancelToken cancel = {}) = 0;

    /** @brief Run against a fresh context holding a single user message. */
    RunResult run(const std::string& input) {
        ConversationContext ctx;
        ctx.append(Message::user(input));
        return run(ctx);
    }

    /**
     * @brief Run to completion, reporting progress to `events`
     *
     * Same contract as run(ctx, cancel). The sink receives every event
     * except the terminal one, which the caller derives from the result.
     * The default implementation reports nothing.
     */
    virtual RunResult run_observed(ConversationContext& ctx, const CancelToken& cancel,
                                   const stream::EventSink& events) {
        (void)events;
        return run(ctx, cancel);
    }

    /**
     * @brief Run on a background thread, observed as an event stream
     *
     * Emits whatever run_observed() reports, then the terminal event.
     */
    virtual std::unique_ptr<stream::StreamingSession> run_streaming(ConversationContext ctx,
                                                                    stream::StreamOptions options = {}) {
        auto self = shared_from_this();
        return std::make_unique<stream::StreamingSession>(
            [self, ctx = std::move(ctx)](stream::StreamingSession& session, const CancelToken& cancel) mutable {
                return self->run_observed(ctx, cancel, session.sink());
            },
            std::move(options));
    }
};

/**
 * @brief Run `member` on behalf of another run
 *
 * With a sink, the member's events, its terminal event included, are
 * forwarded wrapped in MemberEvent under the member's name. Without one,
 * this is a plain run.
 */
inline RunResult run_member(Interactable& member, ConversationContext& ctx, const CancelToken& cancel,
                            const stream::EventSink& events) {
    if (!events) {
        return member.run(ctx, cancel);
    }
    const std::string& name = member.name();
    RunResult result = member.run_observed(ctx, cancel, [&events, &name](stream::RunEvent event) {
        events(stream::tag_member(name, std::move(event)));
    });
    events(stream::tag_member(name, stream::terminal_event(result)));
    return result;
}

} // namespace loom
