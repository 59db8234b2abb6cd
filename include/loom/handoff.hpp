#pragma once

#include "types.hpp"
#include "interactable.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace loom {

/**
 * @brief Terminal transfer of a conversation to another interactable
 *
 * Offered to the model as the tool "transfer_to_<snake_case(target name)>"
 * with an optional `message` argument. When the model selects it, the
 * current run ends and the target continues on a forked context.
 */
struct Handoff {
    std::shared_ptr<Interactable> target;
    std::string description;

    std::string tool_name() const {
        return "transfer_to_" + to_snake_case(target ? target->name() : std::string{});
    }

    nlohmann::json tool_schema() const {
        std::string desc = "Transfer the conversation to " + (target ? target->name() : std::string{}) + ".";
        if (!description.empty()) {
            desc += " " + description;
        }
        return nlohmann::json{
            {"type", "function"},
            {"function", {
                {"name", tool_name()},
                {"description", desc},
                {"parameters", {
                    {"type", "object"},
                    {"properties", {
                        {"message", {
                            {"type", "string"},
                            {"description", "Message passed to the receiving agent"}
                        }}
                    }},
                    {"required", nlohmann::json::array()}
                }}
            }}
        };
    }
};

} // namespace loom
