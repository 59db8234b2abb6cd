#pragma once

#include "../types.hpp"
#include "../context.hpp"
#include "../stream/run_event.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <map>
#include <optional>
#include <vector>
#include <initializer_list>
#include <tuple>
#include <type_traits>
#include <utility>

namespace loom {
namespace engine {

// ============================================================================
// Tool Handler Type
// ============================================================================

/**
 * @brief What a handler sees of the run that invoked it
 *
 * Handlers that start runs of their own pass `cancel` on, so cancelling
 * the caller stops the nested run too, and report the nested run's events
 * through `events` when it is set.
 */
struct ToolContext {
    const ConversationContext& conversation;   ///< Context of the calling run
    CancelToken cancel;                        ///< Cancellation of the calling run
    stream::EventSink events;                  ///< Event stream of the calling run, may be empty
};

/**
 * @brief Callable type for tool execution.
 *
 * Receives the decoded JSON arguments and the calling run.
 */
using ToolHandler = std::function<Expected<nlohmann::json>(const nlohmann::json&, const ToolContext&)>;

/** @brief Tool callable that does not need the calling run. */
using SimpleToolHandler = std::function<Expected<nlohmann::json>(const nlohmann::json&)>;

// ============================================================================
// Signature-derived tools
// ============================================================================

namespace detail {

template<typename T>
constexpr const char* schema_type_of() {
    if constexpr (std::is_same_v<T, bool>) {
        return "boolean";
    } else if constexpr (std::is_integral_v<T>) {
        return "integer";
    } else if constexpr (std::is_floating_point_v<T>) {
        return "number";
    } else {
        static_assert(std::is_same_v<T, std::string>, "Tool parameters must be bool, integral, floating point or std::string");
        return "string";
    }
}

template<typename R, typename... Args>
struct signature {
    using params = std::tuple<std::decay_t<Args>...>;
    static constexpr size_t arity = sizeof...(Args);
};

template<typename T>
struct function_traits : function_traits<decltype(&T::operator())> {};

template<typename R, typename... Args>
struct function_traits<R(*)(Args...)> : signature<R, Args...> {};

template<typename C, typename R, typename... Args>
struct function_traits<R(C::*)(Args...) const> : signature<R, Args...> {};

template<typename C, typename R, typename... Args>
struct function_traits<R(C::*)(Args...)> : signature<R, Args...> {};

template<typename R, typename... Args>
struct function_traits<std::function<R(Args...)>> : signature<R, Args...> {};

/** Object schema with one required property per parameter. */
template<typename Params, size_t... Is>
nlohmann::json object_schema(const std::vector<std::string>& names, std::index_sequence<Is...>) {
    nlohmann::json properties = nlohmann::json::object();
    (void)std::initializer_list<int>{
        (properties[names[Is]] = {{"type", schema_type_of<std::tuple_element_t<Is, Params>>()}}, 0)...
    };
    return nlohmann::json{
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", names}
    };
}

/** Decode the named arguments in parameter order. Throws nlohmann::json::exception. */
template<typename Params, size_t... Is>
Params decode_params(const nlohmann::json& args, const std::vector<std::string>& names,
                     std::index_sequence<Is...>) {
    (void)args;
    (void)names;
    return Params{args.at(names[Is]).template get<std::tuple_element_t<Is, Params>>()...};
}

} // namespace detail

// ============================================================================
// Tool Registration Entry
// ============================================================================

/** @brief Metadata and handler for a single registered tool. */
struct ToolEntry {
    std::string name;                     ///< Unique tool name used for invocation
    std::string description;              ///< Human-readable description shown to the model
    nlohmann::json parameters_schema;     ///< JSON Schema describing expected parameters
    ToolHandler handler;                  ///< Callable that executes the tool logic
    bool requires_confirmation = false;   ///< Pause for approval before executing
};

// ============================================================================
// ToolRegistry
// ============================================================================

/**
 * @brief Registry for tool definitions, schema generation, and invocation.
 *
 * Supports template-based registration (schema generated from the function
 * signature) and manual registration with explicit JSON schemas. Tools
 * marked with require_confirmation() pause a run for approval unless the
 * agent auto-approves.
 *
 * Registries are populated during setup and then shared read-only between
 * agents, including agents running concurrently.
 *
 * @threadsafety All public methods are thread-safe. Read operations use shared
 * locks; write operations use exclusive locks.
 */
class ToolRegistry {
public:
    /**
     * @brief Register a plain callable, deriving the parameter schema from its signature
     *
     * Every parameter becomes a required property named by `param_names`,
     * in order. The return value reaches the model as {"result": value}.
     *
     * @throws std::invalid_argument if param_names does not match the arity of func
     */
    template<typename Func>
    void register_tool(const std::string& name, const std::string& description,
                       const std::vector<std::string>& param_names, Func func) {
        using traits = detail::function_traits<Func>;
        using params = typename traits::params;
        using indices = std::make_index_sequence<traits::arity>;

        if (param_names.size() != traits::arity) {
            throw std::invalid_argument(
                "Tool '" + name + "' has " + std::to_string(traits::arity) + " parameters but " +
                std::to_string(param_names.size()) + " names were given");
        }

        SimpleToolHandler handler = [f = std::move(func), names = param_names](
            const nlohmann::json& args) -> Expected<nlohmann::json> {
            return nlohmann::json{{"result", std::apply(f, detail::decode_params<params>(args, names, indices{}))}};
        };
        register_tool(name, description, detail::object_schema<params>(param_names, indices{}),
                      std::move(handler));
    }

    /**
     * @brief Manual registration with an explicit JSON schema and handler.
     *
     * @param name Tool name (replaces any tool with the same name)
     * @param description Human-readable tool description
     * @param schema JSON Schema describing the tool's parameters
     * @param handler Callable that executes the tool logic
     */
    void register_tool(const std::string& name, const std::string& description,
                       nlohmann::json schema, SimpleToolHandler handler) {
        register_context_tool(name, description, std::move(schema),
            [h = std::move(handler)](const nlohmann::json& args, const ToolContext&) {
                return h(args);
            });
    }

    /**
     * @brief Manual registration of a handler that receives the calling run.
     */
    void register_context_tool(const std::string& name, const std::string& description,
                               nlohmann::json schema, ToolHandler handler) {
        add(ToolEntry{name, description, std::move(schema), std::move(handler), false});
    }

    /** @brief Insert a fully built entry, replacing any tool with the same name. */
    void add(ToolEntry entry) {
        std::unique_lock lock(mutex_);
        auto key = entry.name;
        tools_.insert_or_assign(std::move(key), std::move(entry));
    }

    /**
     * @brief Mark a registered tool as requiring approval before it executes.
     *
     * @return ToolNotFound if no tool has the given name
     */
    Expected<void> require_confirmation(const std::string& name, bool required = true) {
        std::unique_lock lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            return tl::unexpected(Error{ErrorCode::ToolNotFound, "Tool not found: " + name});
        }
        it->second.requires_confirmation = required;
        return {};
    }

    /** @brief Check whether a tool with the given name is registered. */
    bool has_tool(const std::string& name) const {
        std::shared_lock lock(mutex_);
        return tools_.find(name) != tools_.end();
    }

    /** @brief Resolve a tool by name. The returned entry is a copy. */
    std::optional<ToolEntry> find(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool requires_confirmation(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = tools_.find(name);
        return it != tools_.end() && it->second.requires_confirmation;
    }

    /**
     * @brief Invoke a registered tool by name.
     *
     * Exceptions thrown by the handler are converted to ToolExecutionFailed.
     * The handler runs without the registry lock held.
     */
    Expected<nlohmann::json> invoke(const std::string& name, const nlohmann::json& args,
                                    const ToolContext& tool) const {
        auto entry = find(name);
        if (!entry) {
            return tl::unexpected(Error{
                ErrorCode::ToolNotFound,
                "Tool not found: " + name
            });
        }
        return invoke_entry(*entry, args, tool);
    }

    /** @brief Invoke outside of a run: no cancellation, no event stream. */
    Expected<nlohmann::json> invoke(const std::string& name, const nlohmann::json& args,
                                    const ConversationContext& ctx) const {
        return invoke(name, args, ToolContext{ctx, {}, {}});
    }

    /** @brief Invoke a resolved entry, converting handler exceptions to errors. */
    static Expected<nlohmann::json> invoke_entry(const ToolEntry& entry, const nlohmann::json& args,
                                                 const ToolContext& tool) {
        try {
            return entry.handler(args, tool);
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{
                ErrorCode::ToolExecutionFailed,
                std::string("JSON argument error: ") + e.what()
            });
        } catch (const std::exception& e) {
            return tl::unexpected(Error{
                ErrorCode::ToolExecutionFailed,
                e.what()
            });
        }
    }

    /** @brief Get the JSON function-calling schema for a single tool, or empty JSON if not found. */
    nlohmann::json get_tool_schema(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            return nlohmann::json{};
        }
        return build_schema_json(it->second);
    }

    /** @brief Copy of a tool's parameters schema, or nullopt if not found. */
    std::optional<nlohmann::json> get_parameters_schema(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            return std::nullopt;
        }
        return it->second.parameters_schema;
    }

    /** @brief Function-calling schemas for all registered tools, ordered by name. */
    nlohmann::json get_all_schemas() const {
        std::shared_lock lock(mutex_);
        nlohmann::json schemas = nlohmann::json::array();
        for (const auto& [name, entry] : tools_) {
            schemas.push_back(build_schema_json(entry));
        }
        return schemas;
    }

    /** @brief All registered tool names, in sorted order. */
    std::vector<std::string> get_tool_names() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> names;
        names.reserve(tools_.size());
        for (const auto& [name, _] : tools_) {
            names.push_back(name);
        }
        return names;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return tools_.size();
    }

    /** @brief Build the {"type":"function","function":{...}} envelope for an entry. */
    static nlohmann::json build_schema_json(const ToolEntry& entry) {
        return nlohmann::json{
            {"type", "function"},
            {"function", {
                {"name", entry.name},
                {"description", entry.description},
                {"parameters", entry.parameters_schema}
            }}
        };
    }

private:
    std::map<std::string, ToolEntry> tools_;
    mutable std::shared_mutex mutex_;
};

} // namespace engine
} // namespace loom
