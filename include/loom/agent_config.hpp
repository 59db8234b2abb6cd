#pragma once

#include "types.hpp"
#include "handoff.hpp"
#include "engine/context_window.hpp"
#include "engine/guardrail.hpp"
#include "engine/tool_registry.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace loom {

/**
 * @brief Complete configuration of one agent
 *
 * Validated by Agent::create(). The tool registry is shared, not copied,
 * and must not be modified while agents that use it are running.
 */
struct AgentConfig {
    std::string name;                                        ///< Agent name (required, unique within an orchestration)
    std::string model;                                       ///< Model identifier passed to the transport
    std::string instructions;                                ///< System instructions
    int max_turns = 10;                                      ///< Maximum model calls per run (> 0)
    std::optional<double> temperature;                       ///< Sampling temperature in [0, 2]
    bool auto_approve_tools = false;                         ///< Execute confirmable tools without asking

    std::shared_ptr<engine::ToolRegistry> tools;             ///< Tools offered to the model (optional)
    std::vector<engine::Guardrail> input_guardrails;         ///< Checked once against the initiating user text
    std::vector<engine::Guardrail> output_guardrails;        ///< Checked against every model text output
    std::vector<Handoff> handoffs;                           ///< Agents this one may transfer control to
    std::optional<engine::ContextWindowConfig> context_window; ///< Trims the history sent to the model (optional)

    Expected<void> validate() const {
        if (name.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Agent name cannot be empty"});
        }
        if (max_turns <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_turns must be positive", name});
        }
        if (temperature && (*temperature < 0.0 || *temperature > 2.0)) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "temperature must be within [0, 2]", name});
        }
        for (const auto* list : {&input_guardrails, &output_guardrails}) {
            for (const auto& guardrail : *list) {
                if (!guardrail.fn) {
                    return tl::unexpected(Error{
                        ErrorCode::InvalidConfig,
                        "Guardrail '" + guardrail.id + "' has no validator",
                        name
                    });
                }
            }
        }
        if (context_window) {
            if (auto result = context_window->validate(); !result) {
                return tl::unexpected(Error{result.error().code, result.error().message, name});
            }
        }
        std::set<std::string> handoff_names;
        for (const auto& handoff : handoffs) {
            if (!handoff.target) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Handoff target cannot be null", name});
            }
            const auto tool_name = handoff.tool_name();
            if (!handoff_names.insert(tool_name).second) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Duplicate handoff: " + tool_name, name});
            }
            if (tools && tools->has_tool(tool_name)) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidConfig,
                    "Handoff name collides with a registered tool: " + tool_name,
                    name
                });
            }
        }
        return {};
    }
};

} // namespace loom
