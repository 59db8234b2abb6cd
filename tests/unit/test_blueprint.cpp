#include <gtest/gtest.h>
#include "loom/blueprint.hpp"
#include "mocks/mock_transport.hpp"
#include "fixtures/tool_definitions.hpp"
#include <atomic>
#include <memory>

using namespace loom;
using namespace loom::engine;
using namespace loom::testing;
using namespace loom::testing::tools;
using json = nlohmann::json;

class AgentBlueprintTest : public ::testing::Test {
protected:
    ToolRegistry tools;
    GuardrailRegistry guardrails;
    std::shared_ptr<std::atomic<int>> deletes;
    std::shared_ptr<std::atomic<int>> lookups;
    std::shared_ptr<MockTransport> transport;

    void SetUp() override {
        deletes = std::make_shared<std::atomic<int>>(0);
        lookups = std::make_shared<std::atomic<int>>(0);
        register_delete_file(tools, deletes);
        register_lookup(tools, lookups);
        tools.register_tool("add", "Add two integers", {"a", "b"}, add);

        guardrails.register_input("no_secrets", [](const std::string& text, const ConversationContext&) {
            return text.find("password") == std::string::npos
                ? GuardrailResult::pass()
                : GuardrailResult::fail("Secrets are not allowed");
        });
        guardrails.register_output("not_empty", [](const std::string& text, const ConversationContext&) {
            return text.empty() ? GuardrailResult::fail("Empty answer") : GuardrailResult::pass();
        });

        transport = std::make_shared<MockTransport>();
    }

    AgentBlueprint sample() const {
        AgentBlueprint bp;
        bp.name = "Janitor";
        bp.model = "gpt-test";
        bp.instructions = "Keep the disk clean.";
        bp.max_turns = 4;
        bp.temperature = 0.2;
        bp.tool_names = {"delete_file", "lookup"};
        bp.confirmation_tools = {"delete_file"};
        bp.input_guardrail_ids = {"no_secrets"};
        bp.output_guardrail_ids = {"not_empty"};
        return bp;
    }
};

// ============================================================================
// BP-001: Capture and rebuild
// ============================================================================

TEST_F(AgentBlueprintTest, FromConfigCapturesNames) {
    auto config = sample().to_config(tools, guardrails);
    ASSERT_TRUE(config.has_value());

    auto bp = AgentBlueprint::from_config(*config);
    EXPECT_EQ(bp.name, "Janitor");
    EXPECT_EQ(bp.tool_names, (std::vector<std::string>{"delete_file", "lookup"}));
    EXPECT_EQ(bp.confirmation_tools, std::vector<std::string>{"delete_file"});
    EXPECT_EQ(bp.input_guardrail_ids, std::vector<std::string>{"no_secrets"});
    EXPECT_EQ(bp.output_guardrail_ids, std::vector<std::string>{"not_empty"});
    EXPECT_EQ(bp.temperature, std::optional<double>(0.2));
}

TEST_F(AgentBlueprintTest, ToConfigAttachesOnlyNamedTools) {
    auto config = sample().to_config(tools, guardrails);
    ASSERT_TRUE(config.has_value());
    ASSERT_NE(config->tools, nullptr);
    EXPECT_EQ(config->tools->size(), 2u);
    EXPECT_FALSE(config->tools->has_tool("add"));
    EXPECT_TRUE(config->tools->requires_confirmation("delete_file"));
    EXPECT_FALSE(config->tools->requires_confirmation("lookup"));
    EXPECT_EQ(config->max_turns, 4);
}

TEST_F(AgentBlueprintTest, BuiltAgentBehavesLikeConfigured) {
    transport->enqueue_tool_call("delete_file", {{"path", "/tmp/x"}}, "c1");
    auto agent = sample().build(transport, tools, guardrails);
    ASSERT_TRUE(agent.has_value());

    auto rejected = (*agent)->run(std::string("my password is hunter2"));
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error()->code, ErrorCode::InputRejected);

    auto paused = (*agent)->run(std::string("clean up /tmp/x"));
    ASSERT_TRUE(paused.is_paused());
    EXPECT_EQ(deletes->load(), 0);
    EXPECT_EQ(transport->last_request().instructions, "Keep the disk clean.");
}

// ============================================================================
// BP-002: Missing registry entries
// ============================================================================

TEST_F(AgentBlueprintTest, UnknownTool) {
    auto bp = sample();
    bp.tool_names.push_back("format_disk");
    auto config = bp.to_config(tools, guardrails);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::UnknownTool);
    EXPECT_EQ(config.error().message, "Unknown tool: format_disk");
}

TEST_F(AgentBlueprintTest, UnknownGuardrail) {
    auto bp = sample();
    bp.output_guardrail_ids.push_back("polite");
    auto agent = bp.build(transport, tools, guardrails);
    ASSERT_FALSE(agent.has_value());
    EXPECT_EQ(agent.error().code, ErrorCode::UnknownGuardrail);
}

// ============================================================================
// BP-003: JSON
// ============================================================================

TEST_F(AgentBlueprintTest, JsonRoundTrip) {
    auto original = sample();
    auto restored = AgentBlueprint::from_json(json::parse(original.to_json().dump()));
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->to_json(), original.to_json());
    EXPECT_TRUE(restored->to_config(tools, guardrails).has_value());
}

TEST_F(AgentBlueprintTest, FromJsonDefaults) {
    auto bp = AgentBlueprint::from_json({{"name", "Minimal"}});
    ASSERT_TRUE(bp.has_value());
    EXPECT_EQ(bp->max_turns, 10);
    EXPECT_FALSE(bp->temperature.has_value());
    EXPECT_TRUE(bp->tool_names.empty());

    auto config = bp->to_config(tools, guardrails);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->tools, nullptr);
}

TEST_F(AgentBlueprintTest, FromJsonRejectsMalformedDocuments) {
    auto missing_name = AgentBlueprint::from_json(json::object());
    ASSERT_FALSE(missing_name.has_value());
    EXPECT_EQ(missing_name.error().code, ErrorCode::InvalidConfig);

    EXPECT_FALSE(AgentBlueprint::from_json({{"name", "X"}, {"tools", "lookup"}}).has_value());
}

// ============================================================================
// BP-004: Handoffs
// ============================================================================

TEST_F(AgentBlueprintTest, HandoffsRecordedByTargetName) {
    AgentConfig billing_config;
    billing_config.name = "Billing";
    auto billing = *Agent::create(billing_config, std::make_shared<MockTransport>());

    auto config = sample().to_config(tools, guardrails);
    ASSERT_TRUE(config.has_value());
    config->handoffs.push_back(Handoff{billing, "Questions about invoices"});

    auto bp = AgentBlueprint::from_config(*config);
    ASSERT_EQ(bp.handoffs.size(), 1u);
    EXPECT_EQ(bp.handoffs[0].target, "Billing");
    EXPECT_EQ(bp.handoffs[0].description, "Questions about invoices");

    auto restored = AgentBlueprint::from_json(json::parse(bp.to_json().dump()));
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->handoffs, bp.handoffs);
}

TEST_F(AgentBlueprintTest, HandoffsResolvedThroughTargetRegistry) {
    auto billing_transport = std::make_shared<MockTransport>();
    billing_transport->default_response = "Refund issued";
    AgentConfig billing_config;
    billing_config.name = "Billing";
    InteractableRegistry targets{{"Billing", *Agent::create(billing_config, billing_transport)}};

    auto bp = sample();
    bp.handoffs.push_back(HandoffReference{"Billing", "Questions about invoices"});

    transport->enqueue_tool_call("transfer_to_billing", {{"message", "refund order 7"}}, "h1");
    auto agent = bp.build(transport, tools, guardrails, targets);
    ASSERT_TRUE(agent.has_value());
    ASSERT_EQ((*agent)->config().handoffs.size(), 1u);

    auto result = (*agent)->run(std::string("I want my money back"));
    ASSERT_TRUE(result.is_handoff());
    EXPECT_EQ(result.output(), "Refund issued");
    EXPECT_EQ(billing_transport->last_request().messages.back(), Message::user("refund order 7"));
}

TEST_F(AgentBlueprintTest, UnknownHandoffTarget) {
    auto bp = sample();
    bp.handoffs.push_back(HandoffReference{"Legal", ""});

    auto config = bp.to_config(tools, guardrails);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::UnknownHandoffTarget);
    EXPECT_EQ(config.error().message, "Unknown handoff target: Legal");
}

TEST_F(AgentBlueprintTest, FromJsonRejectsMalformedHandoffs) {
    auto bp = AgentBlueprint::from_json({{"name", "X"}, {"handoffs", json::array({{{"description", "no target"}}})}});
    ASSERT_FALSE(bp.has_value());
    EXPECT_EQ(bp.error().code, ErrorCode::InvalidConfig);
}
