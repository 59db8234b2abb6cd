#pragma once

#include "types.hpp"
#include "agent.hpp"
#include "agent_config.hpp"
#include "backend/ITransport.hpp"
#include "engine/guardrail.hpp"
#include "engine/tool_registry.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace loom {

/** @brief Live interactables by name, used to resolve blueprint handoffs. */
using InteractableRegistry = std::map<std::string, std::shared_ptr<Interactable>>;

/** @brief A handoff recorded by its target's name. */
struct HandoffReference {
    std::string target;
    std::string description;

    bool operator==(const HandoffReference& other) const {
        return target == other.target && description == other.description;
    }
};

/**
 * @brief Serializable description of an agent
 *
 * Tools and guardrails are recorded by name and id, handoffs by target
 * name. build() reattaches them through explicitly supplied registries.
 * Context window management is not recorded.
 */
struct AgentBlueprint {
    std::string name;
    std::string model;
    std::string instructions;
    int max_turns = 10;
    std::optional<double> temperature;
    bool auto_approve_tools = false;
    std::vector<std::string> tool_names;
    std::vector<std::string> confirmation_tools;       ///< Subset of tool_names that need approval
    std::vector<std::string> input_guardrail_ids;
    std::vector<std::string> output_guardrail_ids;
    std::vector<HandoffReference> handoffs;

    /** @brief Capture an agent configuration. */
    static AgentBlueprint from_config(const AgentConfig& config) {
        AgentBlueprint bp;
        bp.name = config.name;
        bp.model = config.model;
        bp.instructions = config.instructions;
        bp.max_turns = config.max_turns;
        bp.temperature = config.temperature;
        bp.auto_approve_tools = config.auto_approve_tools;
        if (config.tools) {
            bp.tool_names = config.tools->get_tool_names();
            for (const auto& tool : bp.tool_names) {
                if (config.tools->requires_confirmation(tool)) {
                    bp.confirmation_tools.push_back(tool);
                }
            }
        }
        for (const auto& g : config.input_guardrails) {
            bp.input_guardrail_ids.push_back(g.id);
        }
        for (const auto& g : config.output_guardrails) {
            bp.output_guardrail_ids.push_back(g.id);
        }
        for (const auto& handoff : config.handoffs) {
            if (handoff.target) {
                bp.handoffs.push_back(HandoffReference{handoff.target->name(), handoff.description});
            }
        }
        return bp;
    }

    /**
     * @brief Rebuild a configuration against explicit registries
     *
     * @param targets Handoff targets by name; only consulted when the
     *        blueprint records handoffs
     * @return UnknownTool, UnknownGuardrail or UnknownHandoffTarget naming
     *         the first missing entry
     */
    Expected<AgentConfig> to_config(const engine::ToolRegistry& tools,
                                    const engine::GuardrailRegistry& guardrails,
                                    const InteractableRegistry& targets = {}) const {
        AgentConfig config;
        config.name = name;
        config.model = model;
        config.instructions = instructions;
        config.max_turns = max_turns;
        config.temperature = temperature;
        config.auto_approve_tools = auto_approve_tools;

        if (!tool_names.empty()) {
            auto registry = std::make_shared<engine::ToolRegistry>();
            for (const auto& tool : tool_names) {
                auto entry = tools.find(tool);
                if (!entry) {
                    return tl::unexpected(Error{ErrorCode::UnknownTool, "Unknown tool: " + tool, name});
                }
                registry->add(std::move(*entry));
            }
            for (const auto& tool : confirmation_tools) {
                if (auto marked = registry->require_confirmation(tool); !marked) {
                    return tl::unexpected(Error{ErrorCode::UnknownTool, "Unknown tool: " + tool, name});
                }
            }
            config.tools = std::move(registry);
        }

        auto input = guardrails.resolve_input(input_guardrail_ids);
        if (!input) {
            return tl::unexpected(input.error());
        }
        auto output = guardrails.resolve_output(output_guardrail_ids);
        if (!output) {
            return tl::unexpected(output.error());
        }
        config.input_guardrails = std::move(*input);
        config.output_guardrails = std::move(*output);

        for (const auto& handoff : handoffs) {
            auto it = targets.find(handoff.target);
            if (it == targets.end() || !it->second) {
                return tl::unexpected(Error{
                    ErrorCode::UnknownHandoffTarget,
                    "Unknown handoff target: " + handoff.target,
                    name
                });
            }
            config.handoffs.push_back(Handoff{it->second, handoff.description});
        }
        return config;
    }

    /** @brief Rebuild and create the agent in one step. */
    Expected<std::shared_ptr<Agent>> build(std::shared_ptr<backend::ITransport> transport,
                                           const engine::ToolRegistry& tools,
                                           const engine::GuardrailRegistry& guardrails,
                                           const InteractableRegistry& targets = {}) const {
        auto config = to_config(tools, guardrails, targets);
        if (!config) {
            return tl::unexpected(config.error());
        }
        return Agent::create(std::move(*config), std::move(transport));
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["name"] = name;
        j["model"] = model;
        j["instructions"] = instructions;
        j["max_turns"] = max_turns;
        if (temperature) {
            j["temperature"] = *temperature;
        }
        j["auto_approve_tools"] = auto_approve_tools;
        j["tools"] = tool_names;
        j["confirmation_tools"] = confirmation_tools;
        j["input_guardrails"] = input_guardrail_ids;
        j["output_guardrails"] = output_guardrail_ids;
        j["handoffs"] = nlohmann::json::array();
        for (const auto& handoff : handoffs) {
            j["handoffs"].push_back({{"target", handoff.target}, {"description", handoff.description}});
        }
        return j;
    }

    static Expected<AgentBlueprint> from_json(const nlohmann::json& j) {
        try {
            AgentBlueprint bp;
            bp.name = j.at("name").get<std::string>();
            bp.model = j.value("model", std::string{});
            bp.instructions = j.value("instructions", std::string{});
            bp.max_turns = j.value("max_turns", 10);
            if (auto it = j.find("temperature"); it != j.end() && !it->is_null()) {
                bp.temperature = it->get<double>();
            }
            bp.auto_approve_tools = j.value("auto_approve_tools", false);
            bp.tool_names = j.value("tools", std::vector<std::string>{});
            bp.confirmation_tools = j.value("confirmation_tools", std::vector<std::string>{});
            bp.input_guardrail_ids = j.value("input_guardrails", std::vector<std::string>{});
            bp.output_guardrail_ids = j.value("output_guardrails", std::vector<std::string>{});
            if (auto it = j.find("handoffs"); it != j.end()) {
                for (const auto& handoff : it->get_ref<const nlohmann::json::array_t&>()) {
                    bp.handoffs.push_back(HandoffReference{
                        handoff.at("target").get<std::string>(),
                        handoff.value("description", std::string{})
                    });
                }
            }
            return bp;
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Malformed agent blueprint", std::string(e.what())});
        }
    }
};

} // namespace loom
