#include <gtest/gtest.h>
#include "loom/types.hpp"
#include "loom/serialization.hpp"
#include <thread>

using namespace loom;
using json = nlohmann::json;

// ============================================================================
// Message Tests
// ============================================================================

TEST(MessageTest, FactoryMethods) {
    auto sys = Message::system("System message");
    EXPECT_EQ(sys.role, Role::System);
    EXPECT_EQ(sys.content, "System message");
    EXPECT_FALSE(sys.tool_call_id.has_value());

    auto user = Message::user("User message");
    EXPECT_EQ(user.role, Role::User);
    EXPECT_FALSE(user.is_tool_call());

    auto assistant = Message::assistant("Assistant message");
    EXPECT_EQ(assistant.role, Role::Assistant);
    EXPECT_FALSE(assistant.is_tool_call());
}

TEST(MessageTest, ToolEntriesCarryCorrelationId) {
    ToolCall call{"fc_1", "call_1", "lookup", R"({"query":"x"})"};

    auto request = Message::tool_call(call);
    EXPECT_EQ(request.role, Role::Assistant);
    EXPECT_TRUE(request.is_tool_call());
    EXPECT_EQ(request.content, call.arguments);
    EXPECT_EQ(request.tool_call_id, std::optional<std::string>("call_1"));
    EXPECT_EQ(request.tool_name, std::optional<std::string>("lookup"));

    auto result = Message::tool_result("call_1", "lookup", "found x");
    EXPECT_EQ(result.role, Role::Tool);
    EXPECT_EQ(result.tool_call_id, request.tool_call_id);
    EXPECT_FALSE(result.is_tool_call());
}

TEST(MessageTest, Equality) {
    EXPECT_EQ(Message::user("Hello"), Message::user("Hello"));
    EXPECT_NE(Message::user("Hello"), Message::user("World"));
    EXPECT_NE(Message::user("Hello"), Message::assistant("Hello"));
    EXPECT_NE(Message::tool_result("id1", "t", "r"), Message::tool_result("id2", "t", "r"));
}

TEST(RoleTest, RoundTrip) {
    for (Role role : {Role::System, Role::User, Role::Assistant, Role::Tool}) {
        EXPECT_EQ(role_from_string(role_to_string(role)), role);
    }
    EXPECT_FALSE(role_from_string("developer").has_value());
}

// ============================================================================
// Error Tests
// ============================================================================

TEST(ErrorTest, ToStringWithoutContext) {
    Error error{ErrorCode::TurnLimitExceeded, "Exceeded maximum turns: 3"};
    EXPECT_EQ(error.to_string(), "[302] Exceeded maximum turns: 3");
}

TEST(ErrorTest, ToStringWithContext) {
    Error error{ErrorCode::InputRejected, "Blocked", std::string("Assistant")};
    EXPECT_EQ(error.to_string(), "[300] Blocked | Context: Assistant");
}

TEST(ErrorTest, CodeRanges) {
    EXPECT_EQ(static_cast<int>(ErrorCode::InvalidConfig), 100);
    EXPECT_EQ(static_cast<int>(ErrorCode::TransportFailure), 200);
    EXPECT_EQ(static_cast<int>(ErrorCode::InputRejected), 300);
    EXPECT_EQ(static_cast<int>(ErrorCode::RequestCancelled), 400);
    EXPECT_EQ(static_cast<int>(ErrorCode::ToolNotFound), 500);
    EXPECT_EQ(static_cast<int>(ErrorCode::NoRouteMatched), 600);
}

// ============================================================================
// CancelToken Tests
// ============================================================================

TEST(CancelTokenTest, DefaultTokenIsInert) {
    CancelToken token;
    token.cancel();
    EXPECT_FALSE(token.is_cancelled());
}

TEST(CancelTokenTest, CopiesShareState) {
    auto token = CancelToken::create();
    auto copy = token;
    copy.cancel();
    EXPECT_TRUE(token.is_cancelled());
}

TEST(CancelTokenTest, ChildObservesParent) {
    auto parent = CancelToken::create();
    auto child = parent.child();
    auto grandchild = child.child();

    EXPECT_FALSE(grandchild.is_cancelled());
    parent.cancel();
    EXPECT_TRUE(child.is_cancelled());
    EXPECT_TRUE(grandchild.is_cancelled());
}

TEST(CancelTokenTest, ChildCancelDoesNotReachParent) {
    auto parent = CancelToken::create();
    auto child = parent.child();
    child.cancel();
    EXPECT_TRUE(child.is_cancelled());
    EXPECT_FALSE(parent.is_cancelled());
}

TEST(CancelTokenTest, CancelFromAnotherThread) {
    auto token = CancelToken::create();
    std::thread canceller([token]() { token.cancel(); });
    canceller.join();
    EXPECT_TRUE(token.is_cancelled());
}

// ============================================================================
// Usage and naming
// ============================================================================

TEST(TokenUsageTest, Accumulates) {
    TokenUsage total;
    total += TokenUsage{10, 5, 15};
    total += TokenUsage{1, 2, 3};
    EXPECT_EQ(total, (TokenUsage{11, 7, 18}));
}

TEST(NamingTest, SnakeCase) {
    EXPECT_EQ(to_snake_case("ResearchAgent"), "research_agent");
    EXPECT_EQ(to_snake_case("Billing Team"), "billing_team");
    EXPECT_EQ(to_snake_case("Ops_Supervisor"), "ops_supervisor");
    EXPECT_EQ(to_snake_case("agent2Go"), "agent2_go");
    EXPECT_EQ(to_snake_case("writer"), "writer");
}

TEST(ApprovalDecisionTest, Factories) {
    EXPECT_TRUE(ApprovalDecision::approve().approved);
    auto rejected = ApprovalDecision::reject("too risky");
    EXPECT_FALSE(rejected.approved);
    EXPECT_EQ(rejected.reason, "too risky");
}

// ============================================================================
// Serialization Tests
// ============================================================================

TEST(SerializationTest, ToolResultMessageFields) {
    auto j = serialization::encode(Message::tool_result("call_9", "lookup", "ok"));
    EXPECT_EQ(j["role"], "tool");
    EXPECT_EQ(j["content"], "ok");
    EXPECT_EQ(j["tool_call_id"], "call_9");
    EXPECT_EQ(j["tool_name"], "lookup");

    auto decoded = serialization::decode_message(j);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, Message::tool_result("call_9", "lookup", "ok"));
}

TEST(SerializationTest, PlainMessageOmitsToolFields) {
    auto j = serialization::encode(Message::user("hi"));
    EXPECT_FALSE(j.contains("tool_call_id"));
    EXPECT_FALSE(j.contains("tool_name"));
}

TEST(SerializationTest, RejectsUnknownRole) {
    auto decoded = serialization::decode_message(json{{"role", "robot"}, {"content", "x"}});
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, ErrorCode::InvalidRunState);
}

TEST(SerializationTest, RejectsMissingFields) {
    EXPECT_FALSE(serialization::decode_tool_call(json{{"name", "x"}}).has_value());
    EXPECT_FALSE(serialization::decode_tool_execution(json::array()).has_value());
}

TEST(SerializationTest, ToolExecutionKeepsLatency) {
    ToolExecution execution{"lookup", "call_1", "{}", "found", true, std::chrono::milliseconds(42)};
    auto decoded = serialization::decode_tool_execution(serialization::encode(execution));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->tool_name, "lookup");
    EXPECT_EQ(decoded->output, "found");
    EXPECT_TRUE(decoded->success);
    EXPECT_EQ(decoded->latency.count(), 42);
}
