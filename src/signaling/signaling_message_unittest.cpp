#include "signaling/signaling_message.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

using json = nlohmann::json;

namespace pairrtc {
namespace test {

using signaling::Message;

namespace {

sdp::Description CreateOffer() {
    return sdp::Description::Builder(sdp::Type::OFFER)
            .set_session_id("42")
            .set_ice_ufrag("ufrag")
            .set_ice_pwd("0123456789abcdefghijklmn")
            .set_fingerprint("AA:BB:CC:DD")
            .AddMedia(sdp::Description::Media::Kind::AUDIO, "0")
            .AddMedia(sdp::Description::Media::Kind::VIDEO, "1")
            .Build();
}
    
} // namespace

MY_TEST(SignalingMessageTest, SerializeOffer) {
    auto offer = CreateOffer();
    auto message = Message::Offer(offer, Role::INITIATOR);

    auto json_message = json::parse(message.Serialize());
    EXPECT_EQ(json_message["kind"], "Offer");
    EXPECT_EQ(json_message["senderRole"], "Initiator");
    EXPECT_EQ(json_message["payload"]["type"], "offer");
    EXPECT_EQ(json_message["payload"]["sdp"], offer.GenerateSDP("\r\n"));
}

MY_TEST(SignalingMessageTest, DeserializeAnswer) {
    auto answer_sdp = sdp::Description::Builder(sdp::Type::ANSWER)
                        .set_ice_ufrag("abcd")
                        .set_ice_pwd("pwd")
                        .set_fingerprint("EE:FF")
                        .AddMedia(sdp::Description::Media::Kind::AUDIO, "0")
                        .Build().GenerateSDP();
    json json_message = {
        {"kind", "Answer"},
        {"payload", {{"type", "answer"}, {"sdp", answer_sdp}}},
        {"senderRole", "Responder"}
    };

    auto message = Message::Deserialize(json_message.dump());
    EXPECT_EQ(message.kind, Message::Kind::ANSWER);
    EXPECT_EQ(message.sender_role, Role::RESPONDER);

    auto description = signaling::PayloadToDescription(message.payload);
    EXPECT_EQ(description.type(), sdp::Type::ANSWER);
    EXPECT_EQ(description.ice_ufrag(), "abcd");
}

MY_TEST(SignalingMessageTest, CandidatePayload) {
    sdp::Candidate candidate("candidate:1 1 udp 2122252543 192.168.1.10 50000 typ host", "0", 0);
    auto message = Message::Candidate(candidate, Role::RESPONDER);

    EXPECT_EQ(message.payload["candidate"], "candidate:1 1 udp 2122252543 192.168.1.10 50000 typ host");
    EXPECT_EQ(message.payload["sdpMid"], "0");
    EXPECT_EQ(message.payload["sdpMLineIndex"], 0);

    auto decoded = Message::Deserialize(message.Serialize());
    EXPECT_EQ(decoded.kind, Message::Kind::CANDIDATE);
    EXPECT_EQ(signaling::PayloadToCandidate(decoded.payload), candidate);
}

MY_TEST(SignalingMessageTest, RejectMalformedEnvelope) {
    EXPECT_THROW(Message::Deserialize("not json"), std::invalid_argument);
    EXPECT_THROW(Message::Deserialize("[1, 2, 3]"), std::invalid_argument);
    EXPECT_THROW(Message::Deserialize(R"({"kind":"Bye","payload":{}})"), std::invalid_argument);
    EXPECT_THROW(Message::Deserialize(R"({"kind":"Offer"})"), std::invalid_argument);
    EXPECT_THROW(Message::Deserialize(R"({"kind":"Offer","payload":{},"senderRole":"Host"})"), std::invalid_argument);
}

MY_TEST(SignalingMessageTest, MissingSenderRoleIsIdle) {
    auto message = Message::Deserialize(R"({"kind":"Candidate","payload":{"candidate":"x"}})");
    EXPECT_EQ(message.sender_role, Role::IDLE);
    // The payload is opaque until decoded by the receiver.
    EXPECT_THROW(signaling::PayloadToCandidate(message.payload), std::invalid_argument);
}

MY_TEST(SignalingMessageTest, RejectMalformedPayload) {
    EXPECT_THROW(signaling::PayloadToDescription(json{{"type", "offer"}}), std::invalid_argument);
    EXPECT_THROW(signaling::PayloadToDescription(json{{"type", "rollback"}, {"sdp", "v=0"}}), std::invalid_argument);
    EXPECT_THROW(signaling::PayloadToDescription(json{{"type", "offer"}, {"sdp", "garbage"}}), std::invalid_argument);
    EXPECT_THROW(signaling::PayloadToCandidate(json{{"sdpMid", "0"}}), std::invalid_argument);
}

} // namespace test
} // namespace pairrtc
