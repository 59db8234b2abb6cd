#pragma once

#include "../types.hpp"
#include "../agent.hpp"
#include "../agent_config.hpp"
#include "../context.hpp"
#include "../interactable.hpp"
#include "../run_result.hpp"
#include "../backend/ITransport.hpp"
#include "../engine/tool_registry.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace loom {
namespace orchestration {

// ============================================================================
// Sub-agent tools
// ============================================================================

/**
 * @brief How a delegated run sees the delegating conversation
 */
struct SubAgentToolOptions {
    std::string description;       ///< Tool description shown to the model
    bool share_state = true;       ///< Child starts with a copy of the parent's state
    bool share_history = false;    ///< Child starts with a copy of the parent's history
};

/** @brief Tool name under which an interactable is exposed. */
inline std::string sub_agent_tool_name(const std::string& agent_name) {
    return "invoke_" + to_snake_case(agent_name);
}

/**
 * @brief Expose an interactable as a tool taking {"request": string}
 *
 * Each call runs the interactable on a child context derived from the
 * calling run's context, which the registry passes to the handler. The
 * request is appended as a user message. The child run observes the
 * calling run's cancellation, and its events reach the calling run's
 * stream as MemberEvents. A failed or paused child run becomes a failed
 * tool result that the caller's model can react to.
 */
inline void register_sub_agent_tool(engine::ToolRegistry& registry, std::shared_ptr<Interactable> agent,
                                    SubAgentToolOptions options = {}) {
    const std::string agent_name = agent->name();
    std::string description = options.description.empty()
        ? "Delegate a request to " + agent_name
        : options.description;

    nlohmann::json schema = {
        {"type", "object"},
        {"properties", {
            {"request", {
                {"type", "string"},
                {"description", "The request to send to " + agent_name}
            }}
        }},
        {"required", nlohmann::json::array({"request"})}
    };

    registry.register_context_tool(
        sub_agent_tool_name(agent_name), description, std::move(schema),
        [agent = std::move(agent), options](const nlohmann::json& args,
                                            const engine::ToolContext& tool) -> Expected<nlohmann::json> {
            const ConversationContext& parent = tool.conversation;
            ConversationContext child;
            if (options.share_history) {
                child = parent.fork();
                if (!options.share_state) {
                    for (const auto& [key, value] : parent.state()) {
                        child.set_state(key, nullptr);
                    }
                }
            } else if (options.share_state) {
                child = parent.fork_state_only();
            } else {
                child = parent.fork_trace_only();
            }
            child.append(Message::user(args.at("request").get<std::string>()));

            RunResult result = run_member(*agent, child, tool.cancel, tool.events);
            if (result.is_error()) {
                return tl::unexpected(Error{
                    ErrorCode::ToolExecutionFailed,
                    "'" + agent->name() + "' failed: " + result.error()->message
                });
            }
            if (result.is_paused()) {
                return tl::unexpected(Error{
                    ErrorCode::ToolExecutionFailed,
                    "'" + agent->name() + "' needs approval for '" +
                        result.paused_state()->pending_tool_call().name +
                        "', which cannot be granted through a delegated call"
                });
            }
            return nlohmann::json(result.output());
        });
}

// ============================================================================
// SupervisorAgent
// ============================================================================

/** @brief A worker managed by a supervisor. */
struct Worker {
    std::shared_ptr<Interactable> agent;
    std::string description;      ///< What the worker is good at
};

struct SupervisorConfig {
    std::string name;
    std::string model;
    std::string instructions;                 ///< Prepended to the generated worker listing
    std::vector<Worker> workers;              ///< At least one worker
    int max_turns = 10;
    std::optional<double> temperature;

    Expected<void> validate() const {
        if (name.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Supervisor name cannot be empty"});
        }
        if (workers.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Supervisor needs at least one worker", name});
        }
        std::map<std::string, int> seen;
        for (const auto& worker : workers) {
            if (!worker.agent) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Worker cannot be null", name});
            }
            if (++seen[sub_agent_tool_name(worker.agent->name())] > 1) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidConfig,
                    "Duplicate worker: " + worker.agent->name(),
                    name
                });
            }
        }
        return {};
    }
};

/**
 * @brief Coordinator agent that delegates to workers through tool calls
 *
 * Decomposition and aggregation are left to the coordinator's own
 * agentic loop; each worker is a tool whose execution is a nested run.
 * Workers see the coordinator's state but not its history.
 */
class SupervisorAgent : public Interactable {
public:
    static Expected<std::shared_ptr<SupervisorAgent>> create(SupervisorConfig config,
                                                             std::shared_ptr<backend::ITransport> transport) {
        if (auto result = config.validate(); !result) {
            return tl::unexpected(result.error());
        }

        auto tools = std::make_shared<engine::ToolRegistry>();
        for (const auto& worker : config.workers) {
            register_sub_agent_tool(*tools, worker.agent, SubAgentToolOptions{worker.description, true, false});
        }

        AgentConfig agent_config;
        agent_config.name = config.name;
        agent_config.model = config.model;
        agent_config.instructions = build_instructions(config);
        agent_config.max_turns = config.max_turns;
        agent_config.temperature = config.temperature;
        agent_config.tools = std::move(tools);

        auto agent = Agent::create(std::move(agent_config), std::move(transport));
        if (!agent) {
            return tl::unexpected(agent.error());
        }
        return std::shared_ptr<SupervisorAgent>(new SupervisorAgent(std::move(*agent), std::move(config.workers)));
    }

    const std::string& name() const override { return agent_->name(); }

    const std::vector<Worker>& workers() const { return workers_; }

    /** @brief The coordinating agent, e.g. for resuming one of its paused runs. */
    const std::shared_ptr<Agent>& agent() const { return agent_; }

    using Interactable::run;

    RunResult run(ConversationContext& ctx, CancelToken cancel = {}) override {
        return agent_->run(ctx, std::move(cancel));
    }

    RunResult run_observed(ConversationContext& ctx, const CancelToken& cancel,
                           const stream::EventSink& events) override {
        return agent_->run_observed(ctx, cancel, events);
    }

    std::unique_ptr<stream::StreamingSession> run_streaming(ConversationContext ctx,
                                                            stream::StreamOptions options = {}) override {
        return agent_->run_streaming(std::move(ctx), std::move(options));
    }

    static std::string build_instructions(const SupervisorConfig& config) {
        std::string text = config.instructions;
        if (!text.empty()) {
            text += "\n\n";
        }
        text += "You are a supervisor coordinating the following workers:\n";
        for (const auto& worker : config.workers) {
            text += "- " + sub_agent_tool_name(worker.agent->name()) + ": " + worker.agent->name();
            if (!worker.description.empty()) {
                text += " - " + worker.description;
            }
            text += "\n";
        }
        text += "\nBreak the task into subtasks, delegate each one by calling the matching worker tool, "
                "and combine the workers' results into a final answer.";
        return text;
    }

private:
    SupervisorAgent(std::shared_ptr<Agent> agent, std::vector<Worker> workers)
        : agent_(std::move(agent))
        , workers_(std::move(workers))
    {}

    std::shared_ptr<Agent> agent_;
    std::vector<Worker> workers_;
};

// ============================================================================
// HierarchicalAgents
// ============================================================================

/**
 * @brief A department: a manager coordinating a subset of workers
 */
struct Department {
    std::string name;                 ///< Department name used by send_to_department()
    std::string manager;              ///< Manager name; the supervisor is "<manager>_Supervisor"
    std::string description;          ///< Shown to the executive
    std::string instructions;         ///< Manager instructions
    std::vector<Worker> workers;
};

struct HierarchyConfig {
    std::string executive;            ///< Executive name; the root is "<executive>_Executive"
    std::string model;
    std::string instructions;         ///< Executive instructions
    std::vector<Department> departments;
    int max_turns = 10;

    Expected<void> validate() const {
        if (executive.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Executive name cannot be empty"});
        }
        if (departments.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Hierarchy needs at least one department", executive});
        }
        std::map<std::string, int> seen;
        for (const auto& dept : departments) {
            if (dept.name.empty() || dept.manager.empty()) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidConfig,
                    "Department and manager names cannot be empty",
                    executive
                });
            }
            if (++seen[dept.name] > 1) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Duplicate department: " + dept.name, executive});
            }
        }
        return {};
    }
};

/**
 * @brief Two-level delegation tree
 *
 * Each department becomes a SupervisorAgent over its workers, and an
 * executive SupervisorAgent coordinates the department supervisors.
 * Delegation recurses through the same tool mechanism at both levels.
 */
class HierarchicalAgents : public Interactable {
public:
    static Expected<std::shared_ptr<HierarchicalAgents>> create(HierarchyConfig config,
                                                                std::shared_ptr<backend::ITransport> transport) {
        if (auto result = config.validate(); !result) {
            return tl::unexpected(result.error());
        }

        std::map<std::string, std::shared_ptr<SupervisorAgent>> departments;
        std::vector<Worker> executive_workers;
        for (const auto& dept : config.departments) {
            SupervisorConfig sup;
            sup.name = dept.manager + "_Supervisor";
            sup.model = config.model;
            sup.instructions = dept.instructions;
            sup.workers = dept.workers;
            sup.max_turns = config.max_turns;

            auto supervisor = SupervisorAgent::create(std::move(sup), transport);
            if (!supervisor) {
                return tl::unexpected(supervisor.error());
            }
            std::string description = dept.description.empty() ? dept.name + " department" : dept.description;
            executive_workers.push_back(Worker{*supervisor, std::move(description)});
            departments.emplace(dept.name, std::move(*supervisor));
        }

        SupervisorConfig root;
        root.name = config.executive + "_Executive";
        root.model = config.model;
        root.instructions = config.instructions;
        root.workers = std::move(executive_workers);
        root.max_turns = config.max_turns;

        auto executive = SupervisorAgent::create(std::move(root), std::move(transport));
        if (!executive) {
            return tl::unexpected(executive.error());
        }
        return std::shared_ptr<HierarchicalAgents>(new HierarchicalAgents(
            config.executive + "_Hierarchy", std::move(*executive), std::move(departments)));
    }

    const std::string& name() const override { return name_; }

    const std::shared_ptr<SupervisorAgent>& executive() const { return executive_; }

    /** @brief Department supervisor by department name, or nullptr. */
    std::shared_ptr<SupervisorAgent> department(const std::string& name) const {
        auto it = departments_.find(name);
        return it == departments_.end() ? nullptr : it->second;
    }

    /**
     * @brief Bypass the executive and hand a task to one department
     *
     * @return DepartmentNotFound for an unknown department name
     */
    Expected<RunResult> send_to_department(const std::string& department_name, const std::string& task,
                                           CancelToken cancel = {}) {
        auto supervisor = department(department_name);
        if (!supervisor) {
            return tl::unexpected(Error{
                ErrorCode::DepartmentNotFound,
                "Department not found: " + department_name,
                name_
            });
        }
        ConversationContext ctx;
        ctx.append(Message::user(task));
        return supervisor->run(ctx, std::move(cancel));
    }

    using Interactable::run;

    RunResult run(ConversationContext& ctx, CancelToken cancel = {}) override {
        return executive_->run(ctx, std::move(cancel));
    }

    RunResult run_observed(ConversationContext& ctx, const CancelToken& cancel,
                           const stream::EventSink& events) override {
        return executive_->run_observed(ctx, cancel, events);
    }

    std::unique_ptr<stream::StreamingSession> run_streaming(ConversationContext ctx,
                                                            stream::StreamOptions options = {}) override {
        return executive_->run_streaming(std::move(ctx), std::move(options));
    }

private:
    HierarchicalAgents(std::string name, std::shared_ptr<SupervisorAgent> executive,
                       std::map<std::string, std::shared_ptr<SupervisorAgent>> departments)
        : name_(std::move(name))
        , executive_(std::move(executive))
        , departments_(std::move(departments))
    {}

    std::string name_;
    std::shared_ptr<SupervisorAgent> executive_;
    std::map<std::string, std::shared_ptr<SupervisorAgent>> departments_;
};

} // namespace orchestration
} // namespace loom
