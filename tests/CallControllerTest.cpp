#include "client/CallController.h"
#include "support/FakePeerConnection.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace portal::client {
namespace {

using common::Envelope;
using common::MessageType;
namespace json = boost::json;

class CountingIssuer : public JoinCredentialIssuer {
public:
    std::string issue(const std::string& room, const std::string& participant_name,
                      const std::string& identity) override {
        ++calls;
        if (fail) throw std::runtime_error("issuer offline");
        last_room = room;
        last_name = participant_name;
        return "token-" + identity;
    }

    int calls = 0;
    bool fail = false;
    std::string last_room;
    std::string last_name;
};

std::string presence(const std::string& group, const std::vector<std::string>& ids) {
    json::array devices;
    for (const auto& id : ids) {
        common::Device d;
        d.id = id;
        d.group_id = group;
        d.name = id;
        d.is_present = true;
        devices.emplace_back(common::to_json(d));
    }
    return common::serialize(common::make_envelope(MessageType::PresenceUpdate, json::object{
        {"groupId", group},
        {"presentDevices", std::move(devices)}
    }));
}

class CallControllerTest : public ::testing::Test {
protected:
    CallControllerTest()
        : mesh("b", factory, [this](const Envelope& env) { mesh_out.push_back(env); }),
          controller(CallController::Identity{"b", "family", "Hallway"}, mesh, issuer,
                     [this](const std::string& text) { out.push_back(common::parse_envelope(text)); }) {}

    std::vector<Envelope> out_of(MessageType type) const {
        std::vector<Envelope> result;
        for (const auto& env : out) {
            if (env.type == type) result.push_back(env);
        }
        return result;
    }

    test::FakePeerConnectionFactory factory;
    CountingIssuer issuer;
    std::vector<Envelope> mesh_out;
    std::vector<Envelope> out;
    PeerMeshOrchestrator mesh;
    CallController controller;
};

TEST_F(CallControllerTest, RegistersOnConnect) {
    controller.on_connected();

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].type, MessageType::Register);
    EXPECT_EQ(common::find_string(out[0].payload, "deviceId"), "b");
    EXPECT_EQ(common::find_string(out[0].payload, "groupId"), "family");
    EXPECT_EQ(common::find_string(out[0].payload, "deviceName"), "Hallway");
    EXPECT_FALSE(controller.registered());
}

TEST_F(CallControllerTest, AckMarksRegisteredAndReplaysOngoingMotion) {
    bool moving = true;
    controller.set_motion_check([&] { return moving; });

    controller.handle_message(common::serialize(common::make_envelope(MessageType::RegisterAck,
                                                                      json::object{{"success", true}})));

    EXPECT_TRUE(controller.registered());
    ASSERT_EQ(out_of(MessageType::MotionDetected).size(), 1u);

    moving = false;
    controller.handle_message(common::serialize(common::make_envelope(MessageType::RegisterAck)));
    EXPECT_EQ(out_of(MessageType::MotionDetected).size(), 1u);
}

TEST_F(CallControllerTest, MotionReportsCarryDeviceId) {
    controller.report_motion_detected();
    controller.report_motion_stopped();

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].type, MessageType::MotionDetected);
    EXPECT_EQ(out[1].type, MessageType::MotionStopped);
    EXPECT_EQ(common::find_string(out[1].payload, "deviceId"), "b");
    EXPECT_TRUE(out[1].payload.at("timestamp").is_int64());
}

TEST_F(CallControllerTest, AloneIsNotACall) {
    controller.handle_message(presence("family", {"b"}));

    EXPECT_FALSE(controller.in_call());
    EXPECT_EQ(issuer.calls, 0);
    EXPECT_TRUE(factory.created.empty());
    EXPECT_EQ(controller.present_ids(), (std::vector<std::string>{"b"}));
}

TEST_F(CallControllerTest, QuorumJoinsTheCallOnce) {
    controller.handle_message(presence("family", {"c", "b"}));

    EXPECT_TRUE(controller.in_call());
    EXPECT_EQ(issuer.calls, 1);
    EXPECT_EQ(issuer.last_room, "family");
    EXPECT_EQ(issuer.last_name, "Hallway");
    EXPECT_EQ(controller.credential(), "token-b");
    EXPECT_TRUE(mesh.has_link("c"));

    controller.handle_message(presence("family", {"a", "b", "c"}));

    EXPECT_EQ(issuer.calls, 1);
    EXPECT_EQ(mesh.roster(), (std::set<std::string>{"a", "c"}));
    // "a" sorts first and offers to us.
    EXPECT_FALSE(mesh.has_link("a"));
}

TEST_F(CallControllerTest, LosingQuorumLeavesTheCall) {
    controller.handle_message(presence("family", {"b", "c"}));
    auto link = factory.last_for("c");

    controller.handle_message(presence("family", {"b"}));

    EXPECT_FALSE(controller.in_call());
    EXPECT_FALSE(controller.credential());
    EXPECT_TRUE(link->closed);
    EXPECT_TRUE(mesh.linked_peers().empty());
}

TEST_F(CallControllerTest, OthersPresentWithoutUsIsNotACall) {
    controller.handle_message(presence("family", {"a", "c"}));
    EXPECT_FALSE(controller.in_call());

    controller.handle_message(presence("family", {"b", "c"}));
    ASSERT_TRUE(controller.in_call());

    controller.handle_message(presence("family", {"a", "c"}));
    EXPECT_FALSE(controller.in_call());
}

TEST_F(CallControllerTest, DuplicateIdsDoNotMakeAQuorum) {
    controller.handle_message(presence("family", {"b", "b"}));
    EXPECT_FALSE(controller.in_call());
}

TEST_F(CallControllerTest, OtherGroupsAreIgnored) {
    controller.handle_message(presence("neighbours", {"b", "x"}));

    EXPECT_FALSE(controller.in_call());
    EXPECT_TRUE(controller.present_ids().empty());
}

TEST_F(CallControllerTest, IncomingOfferIsAnsweredThroughTheMesh) {
    controller.handle_message(presence("family", {"a", "b"}));

    Envelope offer = common::make_envelope(MessageType::Offer, json::object{
        {"from", "a"},
        {"to", "b"},
        {"sdp", common::to_json(common::SessionDescription{"offer", "v=0"})}
    });
    controller.handle_message(common::serialize(offer));

    auto link = factory.last_for("a");
    ASSERT_NE(link, nullptr);
    ASSERT_TRUE(link->remote_offer);

    link->complete_description("answer");
    ASSERT_EQ(mesh_out.size(), 1u);
    EXPECT_EQ(mesh_out[0].type, MessageType::Answer);
    EXPECT_EQ(mesh_out[0].to, "a");
}

TEST_F(CallControllerTest, OfferWhileNotInCallCreatesNoLink) {
    controller.handle_message(presence("family", {"a", "b"}));
    controller.handle_message(presence("family", {"a"}));
    ASSERT_FALSE(controller.in_call());

    controller.handle_message(common::serialize(common::make_envelope(MessageType::Offer, json::object{
        {"from", "a"},
        {"to", "b"},
        {"sdp", common::to_json(common::SessionDescription{"offer", "v=0"})}
    })));

    EXPECT_FALSE(mesh.has_link("a"));
    EXPECT_TRUE(factory.created.empty());
    EXPECT_TRUE(mesh_out.empty());
}

TEST_F(CallControllerTest, AnswerAndCandidatesAreRouted) {
    controller.handle_message(presence("family", {"b", "c"}));
    auto link = factory.last_for("c");

    Envelope answer = common::make_envelope(MessageType::Answer, json::object{
        {"sdp", common::to_json(common::SessionDescription{"answer", "v=0"})}
    });
    answer.from = "c";
    controller.handle_message(common::serialize(answer));

    controller.handle_message(common::serialize(common::make_envelope(MessageType::IceCandidate, json::object{
        {"from", "c"},
        {"candidate", common::to_json(common::IceCandidate{"candidate:7", "0"})}
    })));

    ASSERT_TRUE(link->remote_answer);
    ASSERT_EQ(link->remote_candidates.size(), 1u);
    EXPECT_EQ(link->remote_candidates[0].candidate, "candidate:7");
}

TEST_F(CallControllerTest, MalformedMessagesAreIgnored) {
    EXPECT_NO_THROW(controller.handle_message("garbage"));
    EXPECT_NO_THROW(controller.handle_message(R"({"type":"presence_update","payload":{"groupId":"family"}})"));
    EXPECT_NO_THROW(controller.handle_message(R"({"type":"offer","payload":{"from":"a"}})"));
    EXPECT_NO_THROW(controller.handle_message(common::serialize(
        common::make_error(common::error_code::kPeerNotFound, "Device c not connected"))));

    EXPECT_FALSE(controller.in_call());
    EXPECT_TRUE(factory.created.empty());
}

TEST_F(CallControllerTest, DisconnectLeavesTheCall) {
    controller.handle_message(common::serialize(common::make_envelope(MessageType::RegisterAck)));
    controller.handle_message(presence("family", {"b", "c"}));

    controller.on_disconnected();

    EXPECT_FALSE(controller.registered());
    EXPECT_FALSE(controller.in_call());
    EXPECT_TRUE(controller.present_ids().empty());
    EXPECT_TRUE(factory.last_for("c")->closed);
}

TEST_F(CallControllerTest, IssuerFailureStillJoins) {
    issuer.fail = true;

    controller.handle_message(presence("family", {"b", "c"}));

    EXPECT_TRUE(controller.in_call());
    EXPECT_FALSE(controller.credential());
    EXPECT_TRUE(mesh.has_link("c"));
}

TEST(LocalCredentialIssuerTest, TokensAreUniquePerIssue) {
    LocalCredentialIssuer issuer;
    const auto first = issuer.issue("family", "Hallway", "b");
    const auto second = issuer.issue("family", "Hallway", "b");

    EXPECT_NE(first, second);
    EXPECT_NE(first.find(".family.b"), std::string::npos);
}

} // namespace
} // namespace portal::client
