#include <gtest/gtest.h>
#include "loom/agent.hpp"
#include "loom/orchestration/network.hpp"
#include "mocks/mock_transport.hpp"
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace loom;
using namespace loom::orchestration;
using namespace loom::testing;

class AgentNetworkTest : public ::testing::Test {
protected:
    std::vector<std::shared_ptr<MockTransport>> transports;
    NetworkConfig config;

    void SetUp() override {
        config.name = "Council";
        for (const std::string name : {"Economist", "Engineer", "Ethicist"}) {
            add_peer(name);
        }
    }

    std::shared_ptr<Agent> make_agent(const std::string& name, const std::shared_ptr<MockTransport>& transport) {
        AgentConfig agent_config;
        agent_config.name = name;
        return *Agent::create(agent_config, transport);
    }

    void add_peer(const std::string& name) {
        auto transport = std::make_shared<MockTransport>();
        transport->responder = [name](const backend::ModelRequest& request) -> Expected<backend::ModelResponse> {
            size_t assistant = 0;
            for (const auto& message : request.messages) {
                if (message.role == Role::Assistant) {
                    ++assistant;
                }
            }
            backend::ModelResponse response;
            response.text = name + " view after " + std::to_string(assistant);
            return response;
        };
        transports.push_back(transport);
        config.peers.push_back(make_agent(name, transport));
    }

    std::shared_ptr<AgentNetwork> make_network() {
        auto network = AgentNetwork::create(config);
        EXPECT_TRUE(network.has_value());
        return *network;
    }
};

// ============================================================================
// AN-001: Rounds and visibility
// ============================================================================

TEST_F(AgentNetworkTest, EveryPeerSpeaksEveryRound) {
    auto outcome = make_network()->discuss(std::string("Should cities ban cars?"));

    const auto& contributions = outcome.contributions();
    ASSERT_EQ(contributions.size(), 6u);
    EXPECT_EQ(contributions[0].peer, "Economist");
    EXPECT_EQ(contributions[0].round, 1);
    EXPECT_EQ(contributions[5].peer, "Ethicist");
    EXPECT_EQ(contributions[5].round, 2);
    for (const auto& c : contributions) {
        EXPECT_FALSE(c.is_error);
    }
    EXPECT_EQ(outcome.contributions_from("Engineer").size(), 2u);
    EXPECT_EQ(outcome.contributions_from_round(2).size(), 3u);
    EXPECT_FALSE(outcome.synthesis().has_value());
}

TEST_F(AgentNetworkTest, PeersSeeEarlierContributions) {
    auto outcome = make_network()->discuss(std::string("topic"));

    // Second peer, second round: three from round one plus the first peer of round two
    auto request = transports[1]->last_request();
    ASSERT_EQ(request.messages.size(), 6u);
    EXPECT_EQ(request.messages[0], Message::user("topic"));
    for (size_t i = 1; i <= 4; ++i) {
        EXPECT_EQ(request.messages[i].role, Role::Assistant);
        EXPECT_EQ(request.messages[i].content.rfind("[", 0), 0u);
    }
    EXPECT_EQ(request.messages[1].content, "[Economist]: Economist view after 0");
    EXPECT_EQ(request.messages[5].role, Role::System);
    EXPECT_EQ(request.messages[5].content, AgentNetwork::role_reminder("Engineer", 2));

    EXPECT_EQ(outcome.contributions_from("Engineer")[1].output, "Engineer view after 4");
}

TEST_F(AgentNetworkTest, TranscriptHoldsDiscussionButCallerContextIsUntouched) {
    ConversationContext ctx;
    ctx.append(Message::user("topic"));
    auto outcome = make_network()->discuss(ctx);

    EXPECT_EQ(ctx.size(), 1u);
    ASSERT_EQ(outcome.transcript().size(), 7u);
    EXPECT_EQ(outcome.transcript().history().back().content, "[Ethicist]: Ethicist view after 5");
    EXPECT_TRUE(outcome.transcript().parent_trace_id().has_value());
}

TEST_F(AgentNetworkTest, FailedPeerIsRecordedAndSkipped) {
    transports[1]->responder = nullptr;
    transports[1]->enqueue_error("engine stalled");
    transports[1]->default_response = "recovered";
    config.max_rounds = 1;

    auto outcome = make_network()->discuss(std::string("topic"));
    ASSERT_EQ(outcome.contributions().size(), 3u);
    EXPECT_TRUE(outcome.contributions()[1].is_error);
    EXPECT_EQ(outcome.contributions()[1].output, "engine stalled");

    // The failing peer leaves no message behind
    EXPECT_EQ(outcome.contributions()[2].output, "Ethicist view after 1");
    EXPECT_EQ(outcome.transcript().size(), 3u);
}

// ============================================================================
// AN-002: Synthesis and the Interactable entry point
// ============================================================================

TEST_F(AgentNetworkTest, SynthesizerSeesContributions) {
    auto synth_transport = std::make_shared<MockTransport>();
    synth_transport->default_response = "Consensus reached";
    config.synthesizer = make_agent("Moderator", synth_transport);
    config.max_rounds = 1;

    auto outcome = make_network()->discuss(std::string("topic"));
    ASSERT_TRUE(outcome.synthesis().has_value());
    EXPECT_EQ(outcome.synthesis()->output(), "Consensus reached");

    auto prompt = synth_transport->last_request().messages.back().content;
    EXPECT_NE(prompt.find("Discussion topic: topic"), std::string::npos);
    EXPECT_NE(prompt.find("**Engineer** (Round 1): Engineer view after 1"), std::string::npos);
}

TEST_F(AgentNetworkTest, RunReturnsSynthesisWhenConfigured) {
    auto synth_transport = std::make_shared<MockTransport>();
    synth_transport->default_response = "Final answer";
    config.synthesizer = make_agent("Moderator", synth_transport);

    auto result = make_network()->run(std::string("topic"));
    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.output(), "Final answer");
}

TEST_F(AgentNetworkTest, RunReturnsLastSuccessfulContribution) {
    auto result = make_network()->run(std::string("topic"));
    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.output(), "Ethicist view after 5");
}

TEST_F(AgentNetworkTest, RunFailsWhenEveryPeerFails) {
    for (auto& transport : transports) {
        transport->responder = [](const backend::ModelRequest&) -> Expected<backend::ModelResponse> {
            return tl::unexpected(Error{ErrorCode::TransportFailure, "down"});
        };
    }
    auto result = make_network()->run(std::string("topic"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code, ErrorCode::MemberFailed);
}

TEST_F(AgentNetworkTest, CancelledDiscussionStopsEarly) {
    auto cancel = CancelToken::create();
    cancel.cancel();
    auto network = make_network();

    auto outcome = network->discuss(std::string("topic"), cancel);
    EXPECT_TRUE(outcome.contributions().empty());
    for (const auto& transport : transports) {
        EXPECT_EQ(transport->call_count(), 0);
    }

    ConversationContext ctx;
    ctx.append(Message::user("topic"));
    auto result = network->run(ctx, cancel);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code, ErrorCode::RequestCancelled);
}

// ============================================================================
// AN-003: Broadcast and configuration
// ============================================================================

TEST_F(AgentNetworkTest, BroadcastRunsPeersIndependently) {
    auto results = make_network()->broadcast("status?");
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].output(), "Economist view after 0");
    EXPECT_EQ(results[1].output(), "Engineer view after 0");
    EXPECT_EQ(results[2].output(), "Ethicist view after 0");
}

TEST_F(AgentNetworkTest, CreateValidatesConfig) {
    NetworkConfig lonely;
    lonely.peers.push_back(config.peers.front());
    auto result = AgentNetwork::create(lonely);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfig);

    config.max_rounds = 0;
    EXPECT_FALSE(AgentNetwork::create(config).has_value());
}

// ============================================================================
// AN-004: Streaming
// ============================================================================

TEST_F(AgentNetworkTest, StreamingForwardsPeerEventsInSpeakingOrder) {
    ConversationContext ctx;
    ctx.append(Message::user("Should cities ban cars?"));
    auto session = make_network()->run_streaming(ctx);

    std::vector<std::string> finished;
    std::optional<std::string> final_output;
    while (auto event = session->next()) {
        if (const auto* member = std::get_if<stream::MemberEvent>(&*event)) {
            if (const auto* done = std::get_if<stream::Completed>(member->event.get())) {
                finished.push_back(member->member + ": " + done->result.output());
            }
        } else if (const auto* done = std::get_if<stream::Completed>(&*event)) {
            final_output = done->result.output();
        }
    }

    EXPECT_EQ(finished, (std::vector<std::string>{
        "Economist: Economist view after 0",
        "Engineer: Engineer view after 1",
        "Ethicist: Ethicist view after 2",
        "Economist: Economist view after 3",
        "Engineer: Engineer view after 4",
        "Ethicist: Ethicist view after 5",
    }));
    EXPECT_EQ(final_output, std::optional<std::string>("Ethicist view after 5"));
}
