#include <gtest/gtest.h>
#include "loom/agent.hpp"
#include "mocks/mock_transport.hpp"
#include "fixtures/tool_definitions.hpp"
#include <atomic>
#include <memory>

using namespace loom;
using namespace loom::engine;
using namespace loom::testing;
using namespace loom::testing::tools;
using json = nlohmann::json;

class RunStateTest : public ::testing::Test {
protected:
    std::shared_ptr<MockTransport> transport;
    std::shared_ptr<ToolRegistry> registry;
    std::shared_ptr<std::atomic<int>> deletes;
    std::shared_ptr<std::atomic<int>> lookups;
    std::shared_ptr<Agent> agent;

    void SetUp() override {
        transport = std::make_shared<MockTransport>();
        registry = std::make_shared<ToolRegistry>();
        deletes = std::make_shared<std::atomic<int>>(0);
        lookups = std::make_shared<std::atomic<int>>(0);
        register_delete_file(*registry, deletes);
        register_lookup(*registry, lookups);

        AgentConfig config;
        config.name = "FileAgent";
        config.tools = registry;
        agent = *Agent::create(config, transport);
    }

    void script_delete_then_answer() {
        transport->enqueue_tool_call("lookup", {{"query", "tmp files"}}, "c0");
        transport->enqueue_tool_call("delete_file", {{"path", "/tmp/a"}}, "c1");
        transport->enqueue_text("Cleaned up.");
    }

    RunResult pause() {
        script_delete_then_answer();
        ConversationContext ctx;
        ctx.append(Message::user("clean tmp"));
        auto result = agent->run(ctx);
        EXPECT_TRUE(result.is_paused());
        return result;
    }
};

// ============================================================================
// RS-001: Pausing captures everything needed to continue
// ============================================================================

TEST_F(RunStateTest, PausedStateSnapshot) {
    auto result = pause();
    const auto& state = *result.paused_state();

    EXPECT_EQ(state.agent_name(), "FileAgent");
    EXPECT_EQ(state.pending_tool_call().name, "delete_file");
    EXPECT_EQ(state.pending_tool_call().call_id, "c1");
    EXPECT_TRUE(state.queued_tool_calls().empty());
    EXPECT_EQ(state.turns_used(), 2);
    ASSERT_EQ(state.tool_executions().size(), 1u);
    EXPECT_EQ(state.tool_executions()[0].tool_name, "lookup");
    EXPECT_FALSE(state.is_resolved());

    // The pending request entry is already part of the snapshot
    EXPECT_TRUE(state.context().history().back().is_tool_call());
    EXPECT_EQ(deletes->load(), 0);
}

// ============================================================================
// RS-002: Pause then approve equals a run with an approving handler
// ============================================================================

TEST_F(RunStateTest, ResumeMatchesDirectApproval) {
    auto paused = pause();
    auto& state = *paused.paused_state();
    ASSERT_TRUE(state.approve().has_value());
    auto resumed = agent->resume(state);
    ASSERT_TRUE(resumed.has_value());

    transport->reset();
    script_delete_then_answer();
    ConversationContext ctx;
    ctx.append(Message::user("clean tmp"));
    auto direct = agent->run(ctx, CancelToken{}, [](const ToolCall&) { return ApprovalDecision::approve(); });

    ASSERT_TRUE(resumed->is_success());
    ASSERT_TRUE(direct.is_success());
    EXPECT_EQ(resumed->output(), direct.output());
    EXPECT_EQ(resumed->turns_used(), direct.turns_used());
    EXPECT_EQ(resumed->turns_used(), 3);
    EXPECT_EQ(resumed->context().history(), direct.context().history());
    ASSERT_EQ(resumed->tool_executions().size(), direct.tool_executions().size());
    for (size_t i = 0; i < direct.tool_executions().size(); ++i) {
        EXPECT_EQ(resumed->tool_executions()[i].call_id, direct.tool_executions()[i].call_id);
        EXPECT_EQ(resumed->tool_executions()[i].output, direct.tool_executions()[i].output);
    }
    EXPECT_EQ(deletes->load(), 2);
}

TEST_F(RunStateTest, ApproveWithSuppliedOutput) {
    auto paused = pause();
    auto& state = *paused.paused_state();
    ASSERT_TRUE(state.approve("deleted by operator").has_value());

    auto resumed = agent->resume(state);
    ASSERT_TRUE(resumed.has_value());
    ASSERT_TRUE(resumed->is_success());
    EXPECT_EQ(deletes->load(), 0);
    EXPECT_EQ(resumed->tool_executions().back().output, "deleted by operator");
    EXPECT_TRUE(resumed->tool_executions().back().success);
}

TEST_F(RunStateTest, RejectIsShownToModel) {
    auto paused = pause();
    auto& state = *paused.paused_state();
    ASSERT_TRUE(state.reject("not allowed").has_value());

    auto resumed = agent->resume(state);
    ASSERT_TRUE(resumed.has_value());
    ASSERT_TRUE(resumed->is_success());
    EXPECT_EQ(deletes->load(), 0);

    const auto& history = resumed->context().history();
    EXPECT_EQ(history[history.size() - 2],
              Message::tool_result("c1", "delete_file", "Tool execution was rejected: not allowed"));
    EXPECT_FALSE(resumed->tool_executions().back().success);
}

TEST_F(RunStateTest, QueuedCallsRunAfterDecision) {
    transport->enqueue_tool_calls({
        MockTransport::make_call("delete_file", {{"path", "/tmp/a"}}, "c1"),
        MockTransport::make_call("lookup", {{"query", "after"}}, "c2"),
    });
    transport->enqueue_text("Done.");

    auto paused = agent->run(std::string("go"));
    ASSERT_TRUE(paused.is_paused());
    auto& state = *paused.paused_state();
    ASSERT_EQ(state.queued_tool_calls().size(), 1u);
    EXPECT_EQ(lookups->load(), 0);

    ASSERT_TRUE(state.approve().has_value());
    auto resumed = agent->resume(state);
    ASSERT_TRUE(resumed.has_value());
    ASSERT_TRUE(resumed->is_success());
    EXPECT_EQ(lookups->load(), 1);
    ASSERT_EQ(resumed->tool_executions().size(), 2u);
    EXPECT_EQ(resumed->tool_executions()[0].call_id, "c1");
    EXPECT_EQ(resumed->tool_executions()[1].call_id, "c2");
}

TEST_F(RunStateTest, ResumeCanPauseAgain) {
    transport->enqueue_tool_call("delete_file", {{"path", "/tmp/a"}}, "c1");
    transport->enqueue_tool_call("delete_file", {{"path", "/tmp/b"}}, "c2");
    transport->enqueue_text("Both gone.");

    auto first = agent->run(std::string("delete both"));
    ASSERT_TRUE(first.is_paused());
    ASSERT_TRUE(first.paused_state()->approve().has_value());

    auto second = agent->resume(*first.paused_state());
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(second->is_paused());
    EXPECT_EQ(second->paused_state()->pending_tool_call().call_id, "c2");
    EXPECT_EQ(second->paused_state()->tool_executions().size(), 1u);

    ASSERT_TRUE(second->paused_state()->approve().has_value());
    auto done = agent->resume(*second->paused_state());
    ASSERT_TRUE(done.has_value());
    ASSERT_TRUE(done->is_success());
    EXPECT_EQ(deletes->load(), 2);
    EXPECT_EQ(done->turns_used(), 3);
}

// ============================================================================
// RS-003: Invalid resume attempts
// ============================================================================

TEST_F(RunStateTest, ResumeUndecidedFails) {
    auto paused = pause();
    auto resumed = agent->resume(*paused.paused_state());
    ASSERT_FALSE(resumed.has_value());
    EXPECT_EQ(resumed.error().code, ErrorCode::InvalidResumeState);
}

TEST_F(RunStateTest, ResumeTwiceFails) {
    auto paused = pause();
    auto& state = *paused.paused_state();
    ASSERT_TRUE(state.approve().has_value());
    ASSERT_TRUE(agent->resume(state).has_value());

    auto again = agent->resume(state);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::InvalidResumeState);
    EXPECT_EQ(again.error().message, "Run state was already resumed");
}

TEST_F(RunStateTest, SecondDecisionFails) {
    auto paused = pause();
    auto& state = *paused.paused_state();
    ASSERT_TRUE(state.approve().has_value());

    auto second = state.reject("changed my mind");
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, ErrorCode::InvalidResumeState);
    EXPECT_EQ(state.resolution(), PausedRunState::Resolution::Approved);
}

TEST_F(RunStateTest, ResumeOnOtherAgentFails) {
    auto paused = pause();
    ASSERT_TRUE(paused.paused_state()->approve().has_value());

    AgentConfig other_config;
    other_config.name = "OtherAgent";
    auto other = *Agent::create(other_config, transport);
    auto resumed = other->resume(*paused.paused_state());
    ASSERT_FALSE(resumed.has_value());
    EXPECT_EQ(resumed.error().code, ErrorCode::InvalidResumeState);
}

// ============================================================================
// RS-004: Serialization
// ============================================================================

TEST_F(RunStateTest, JsonRoundTripResumes) {
    auto paused = pause();
    ASSERT_TRUE(paused.paused_state()->approve().has_value());

    json document = paused.paused_state()->to_json();
    EXPECT_EQ(document["resolution"]["status"], "approved");

    auto restored = PausedRunState::from_json(json::parse(document.dump()));
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->agent_name(), "FileAgent");
    EXPECT_EQ(restored->pending_tool_call(), paused.paused_state()->pending_tool_call());
    EXPECT_EQ(restored->context().history(), paused.paused_state()->context().history());
    EXPECT_EQ(restored->turns_used(), 2);
    EXPECT_TRUE(restored->is_resolved());
    EXPECT_FALSE(restored->is_consumed());

    auto resumed = agent->resume(*restored);
    ASSERT_TRUE(resumed.has_value());
    ASSERT_TRUE(resumed->is_success());
    EXPECT_EQ(resumed->output(), "Cleaned up.");
}

TEST_F(RunStateTest, UndecidedStateCanBeDecidedAfterRestore) {
    auto paused = pause();
    auto restored = PausedRunState::from_json(paused.paused_state()->to_json());
    ASSERT_TRUE(restored.has_value());
    EXPECT_FALSE(restored->is_resolved());

    ASSERT_TRUE(restored->reject("no").has_value());
    auto again = PausedRunState::from_json(restored->to_json());
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->resolution(), PausedRunState::Resolution::Rejected);
    EXPECT_EQ(again->rejection_reason(), "no");
}

TEST_F(RunStateTest, FromJsonRejectsMalformedDocuments) {
    EXPECT_EQ(PausedRunState::from_json(json("nope")).error().code, ErrorCode::InvalidRunState);
    EXPECT_FALSE(PausedRunState::from_json(json::object()).has_value());

    auto paused = pause();
    json document = paused.paused_state()->to_json();
    document["resolution"]["status"] = "maybe";
    auto result = PausedRunState::from_json(document);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "Unknown resolution status: maybe");
}
