#pragma once

#include "../types.hpp"
#include "../context.hpp"
#include "../interactable.hpp"
#include "../log.hpp"
#include "../run_result.hpp"
#include "../backend/ITransport.hpp"
#include <cctype>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace loom {
namespace orchestration {

/** @brief A routing target and the description the classifier sees. */
struct Route {
    std::string description;
    std::shared_ptr<Interactable> target;
};

struct RouterConfig {
    std::string name = "Router";
    std::string model;                              ///< Model used for classification
    std::vector<Route> routes;                      ///< At least one route
    std::shared_ptr<Interactable> fallback;         ///< Used when no route matches (optional)

    Expected<void> validate() const {
        if (name.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Router name cannot be empty"});
        }
        if (routes.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Router needs at least one route", name});
        }
        for (const auto& route : routes) {
            if (!route.target) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Route target cannot be null", name});
            }
        }
        return {};
    }
};

/**
 * @brief Classify-then-delegate router
 *
 * One lightweight model call sees only the route descriptions and picks
 * a route by number. The chosen target then handles the original input.
 */
class Router : public Interactable {
public:
    static Expected<std::shared_ptr<Router>> create(RouterConfig config,
                                                    std::shared_ptr<backend::ITransport> transport) {
        if (auto result = config.validate(); !result) {
            return tl::unexpected(result.error());
        }
        if (!transport) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Transport cannot be null", config.name});
        }
        return std::shared_ptr<Router>(new Router(std::move(config), std::move(transport)));
    }

    const std::string& name() const override { return config_.name; }

    const std::vector<Route>& routes() const { return config_.routes; }

    /**
     * @brief Select a target for `input` without running it
     *
     * @return The selected route target, the fallback when nothing matches,
     *         or nullptr when nothing matches and there is no fallback.
     *         TransportFailure if the classification call fails.
     */
    Expected<std::shared_ptr<Interactable>> classify(const std::string& input) const {
        backend::ModelRequest request;
        request.model = config_.model;
        request.messages.push_back(Message::user(classification_prompt(input)));
        request.temperature = 0.0;

        auto response = transport_->send(request);
        if (!response) {
            log::get_logger()->warn("Router '{}' classification failed: {}", config_.name,
                                    response.error().to_string());
            return tl::unexpected(Error{ErrorCode::TransportFailure, response.error().message, config_.name});
        }

        auto index = parse_choice(response->text);
        if (index && *index >= 1 && *index <= static_cast<int>(config_.routes.size())) {
            return config_.routes[static_cast<size_t>(*index - 1)].target;
        }
        log::get_logger()->debug("Router '{}' found no route in reply '{}'", config_.name, response->text);
        return config_.fallback;
    }

    /**
     * @brief Classify the latest user message and delegate the conversation
     *
     * The target runs on `ctx` itself, with trace ids assigned if missing;
     * its result is returned unmodified.
     */
    RunResult route(ConversationContext& ctx, CancelToken cancel = {}, const stream::EventSink& events = {}) {
        const std::string input = ctx.last_user_text();
        if (input.empty()) {
            return RunResult::failure(Error{ErrorCode::MissingUserInput, "No user message to route", config_.name}, ctx);
        }

        auto target = classify(input);
        if (!target) {
            return RunResult::failure(target.error(), ctx);
        }
        if (!*target) {
            return RunResult::failure(Error{
                ErrorCode::NoRouteMatched,
                "No suitable route found for input",
                config_.name
            }, ctx);
        }

        ctx.ensure_trace_context();
        log::get_logger()->debug("Router '{}' routing to '{}'", config_.name, (*target)->name());
        return run_member(**target, ctx, cancel, events);
    }

    using Interactable::run;

    RunResult run(ConversationContext& ctx, CancelToken cancel = {}) override {
        return route(ctx, std::move(cancel));
    }

    /** @brief As run(), forwarding the chosen target's events as MemberEvents. */
    RunResult run_observed(ConversationContext& ctx, const CancelToken& cancel,
                           const stream::EventSink& events) override {
        return route(ctx, cancel, events);
    }

    std::string classification_prompt(const std::string& input) const {
        std::string prompt =
            "You are a routing classifier. Select the single best handler for the user input.\n\n"
            "Available handlers:\n";
        for (size_t i = 0; i < config_.routes.size(); ++i) {
            prompt += std::to_string(i + 1) + ". " + config_.routes[i].target->name() +
                      " - handles: " + config_.routes[i].description + "\n";
        }
        prompt += "\nUser input: \"" + input + "\"\n\n";
        prompt += "Respond with ONLY the handler number (1-" + std::to_string(config_.routes.size()) +
                  "). Respond with 0 if no handler fits.";
        return prompt;
    }

    /** @brief First integer in the classifier reply, if any. */
    static std::optional<int> parse_choice(const std::string& reply) {
        size_t i = 0;
        while (i < reply.size() && !std::isdigit(static_cast<unsigned char>(reply[i]))) {
            ++i;
        }
        if (i == reply.size()) {
            return std::nullopt;
        }
        int value = 0;
        size_t digits = 0;
        while (i < reply.size() && std::isdigit(static_cast<unsigned char>(reply[i])) && digits < 6) {
            value = value * 10 + (reply[i] - '0');
            ++i;
            ++digits;
        }
        return value;
    }

private:
    Router(RouterConfig config, std::shared_ptr<backend::ITransport> transport)
        : config_(std::move(config))
        , transport_(std::move(transport))
    {}

    RouterConfig config_;
    std::shared_ptr<backend::ITransport> transport_;
};

} // namespace orchestration
} // namespace loom
