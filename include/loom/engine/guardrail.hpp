#pragma once

#include "../types.hpp"
#include "../context.hpp"
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace loom {
namespace engine {

/**
 * @brief Outcome of a guardrail check
 */
struct GuardrailResult {
    bool passed = true;
    std::string reason;   ///< Why the text was rejected (failures only)

    static GuardrailResult pass() {
        return GuardrailResult{true, {}};
    }

    static GuardrailResult fail(std::string reason) {
        return GuardrailResult{false, std::move(reason)};
    }
};

/** @brief Validator over input or output text. */
using GuardrailFn = std::function<GuardrailResult(const std::string& text, const ConversationContext& ctx)>;

/**
 * @brief A named validator attached to an agent
 *
 * The id is what an AgentBlueprint records, so a guardrail defined as a
 * closure can be reattached after deserialization through a
 * GuardrailRegistry.
 */
struct Guardrail {
    std::string id;
    GuardrailFn fn;

    /** @brief Run the check. A throwing validator counts as a failure. */
    GuardrailResult check(const std::string& text, const ConversationContext& ctx) const {
        if (!fn) {
            return GuardrailResult::fail("Guardrail '" + id + "' has no validator");
        }
        try {
            return fn(text, ctx);
        } catch (const std::exception& e) {
            return GuardrailResult::fail("Guardrail '" + id + "' threw: " + e.what());
        }
    }
};

/**
 * @brief Run guardrails in order and return the first failure, if any.
 */
inline std::optional<GuardrailResult> first_failure(const std::vector<Guardrail>& guardrails,
                                                    const std::string& text,
                                                    const ConversationContext& ctx) {
    for (const auto& guardrail : guardrails) {
        auto result = guardrail.check(text, ctx);
        if (!result.passed) {
            if (result.reason.empty()) {
                result.reason = "Rejected by guardrail '" + guardrail.id + "'";
            }
            return result;
        }
    }
    return std::nullopt;
}

/**
 * @brief Explicit id -> guardrail lookup used to rebuild agents from blueprints
 *
 * Passed to whoever reconstructs an agent; there is no process-wide
 * instance. Input and output guardrails live in separate namespaces, so
 * the same id may name one of each.
 *
 * @threadsafety All public methods are thread-safe.
 */
class GuardrailRegistry {
public:
    void register_input(const std::string& id, GuardrailFn fn) {
        std::unique_lock lock(mutex_);
        input_.insert_or_assign(id, Guardrail{id, std::move(fn)});
    }

    void register_output(const std::string& id, GuardrailFn fn) {
        std::unique_lock lock(mutex_);
        output_.insert_or_assign(id, Guardrail{id, std::move(fn)});
    }

    std::optional<Guardrail> find_input(const std::string& id) const {
        std::shared_lock lock(mutex_);
        auto it = input_.find(id);
        if (it == input_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<Guardrail> find_output(const std::string& id) const {
        std::shared_lock lock(mutex_);
        auto it = output_.find(id);
        if (it == output_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Resolve a list of input guardrail ids.
     *
     * @return UnknownGuardrail naming the first id that is not registered
     */
    Expected<std::vector<Guardrail>> resolve_input(const std::vector<std::string>& ids) const {
        return resolve(ids, input_, "input");
    }

    Expected<std::vector<Guardrail>> resolve_output(const std::vector<std::string>& ids) const {
        return resolve(ids, output_, "output");
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return input_.size() + output_.size();
    }

private:
    Expected<std::vector<Guardrail>> resolve(const std::vector<std::string>& ids,
                                             const std::map<std::string, Guardrail>& table,
                                             const char* kind) const {
        std::shared_lock lock(mutex_);
        std::vector<Guardrail> out;
        out.reserve(ids.size());
        for (const auto& id : ids) {
            auto it = table.find(id);
            if (it == table.end()) {
                return tl::unexpected(Error{
                    ErrorCode::UnknownGuardrail,
                    std::string("Unknown ") + kind + " guardrail: " + id
                });
            }
            out.push_back(it->second);
        }
        return out;
    }

    std::map<std::string, Guardrail> input_;
    std::map<std::string, Guardrail> output_;
    mutable std::shared_mutex mutex_;
};

} // namespace engine
} // namespace loom
