#pragma once

/**
 * @file loom.hpp
 * @brief Main convenience header for Loom
 *
 * Include this single header to get access to all public Loom APIs.
 *
 * Loom is a header-only C++17 library for building agents on top of a
 * chat model: an agentic loop with tools, guardrails, handoffs and human
 * approval, plus orchestration primitives that compose agents.
 *
 * Quick Start:
 * @code
 * #include <loom/loom.hpp>
 *
 * int main() {
 *     auto transport = std::make_shared<MyTransport>();   // implements loom::backend::ITransport
 *
 *     loom::AgentConfig config;
 *     config.name = "Assistant";
 *     config.model = "my-model";
 *     config.instructions = "You are a helpful assistant.";
 *
 *     auto agent = loom::Agent::create(config, transport);
 *     if (!agent) {
 *         std::cerr << "Error: " << agent.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     auto result = (*agent)->run("Hello!");
 *     if (result.is_success()) {
 *         std::cout << "Assistant: " << result.output() << std::endl;
 *     } else if (result.is_error()) {
 *         std::cerr << "Error: " << result.error()->to_string() << std::endl;
 *     }
 *
 *     return 0;
 * }
 * @endcode
 *
 * Key Components:
 * - loom::Agent: Model plus tools, run as an agentic loop
 * - loom::ConversationContext: History, state and trace ids of one conversation
 * - loom::RunResult: Success, handoff, error or paused outcome
 * - loom::PausedRunState: Resumable snapshot awaiting a human decision
 * - loom::orchestration: Router, ParallelGroup, AgentNetwork, SupervisorAgent
 *
 * Thread Safety:
 * - Agents and orchestration primitives are safe to run concurrently
 * - A ConversationContext must not be shared between concurrent runs
 * - Tool handlers may run on any thread
 */

// Core types
#include "types.hpp"
#include "context.hpp"
#include "serialization.hpp"
#include "log.hpp"

// Agents
#include "agent_config.hpp"
#include "agent.hpp"
#include "blueprint.hpp"
#include "handoff.hpp"
#include "interactable.hpp"
#include "run_result.hpp"
#include "run_state.hpp"

// Transport interface (for custom model clients and testing)
#include "backend/ITransport.hpp"

// Engine components
#include "engine/tool_registry.hpp"
#include "engine/argument_validator.hpp"
#include "engine/guardrail.hpp"
#include "engine/context_window.hpp"
#include "engine/agentic_loop.hpp"

// Streaming
#include "partial_json.hpp"
#include "stream/run_event.hpp"
#include "stream/event_channel.hpp"
#include "stream/streaming_session.hpp"

// Orchestration
#include "orchestration/router.hpp"
#include "orchestration/parallel.hpp"
#include "orchestration/network.hpp"
#include "orchestration/supervisor.hpp"

/**
 * @namespace loom
 * @brief Main namespace for Loom
 *
 * Nested namespaces:
 * - loom::backend - Transport interface
 * - loom::engine - Tool registry, guardrails and the agentic loop
 * - loom::stream - Streaming sessions and events
 * - loom::orchestration - Multi-agent composition
 * - loom::log - Library logger
 */
