#include "session/negotiation_state_machine.hpp"
#include "signaling/signaling_hub.hpp"
#include "testing/simulated_time_controller.hpp"
#include "testing/simulated_peer_transport.hpp"
#include "testing/simulated_media.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::Field;
using ::testing::NiceMock;

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

#include <vector>

namespace pairrtc {
namespace test {
namespace {

using State = NegotiationStateMachine::State;
using signaling::Message;

constexpr char kChannelName[] = "negotiation_channel";
constexpr TimeDelta kMediaDelay = TimeDelta::Millis(10);
constexpr TimeDelta kConnectDelay = TimeDelta::Millis(50);

sdp::Description CreatePeerDescription(sdp::Type type, bool with_fingerprint = true) {
    sdp::Description::Builder builder(type);
    builder.set_ice_ufrag("peer")
           .set_ice_pwd("peerpassword0123456789ab")
           .AddMedia(sdp::Description::Media::Kind::AUDIO, "0")
           .AddMedia(sdp::Description::Media::Kind::VIDEO, "1");
    if (with_fingerprint) {
        builder.set_fingerprint("AB:CD:EF:01:23:45:67:89");
    }
    return builder.Build();
}

sdp::Candidate CreatePeerCandidate(int index) {
    return sdp::Candidate("candidate:peer" + std::to_string(index) + " 1 udp 2122260223 10.0.0.2 " + 
                          std::to_string(6000 + index) + " typ host", "0", 0);
}

class MockObserver : public NegotiationStateMachine::Observer {
public:
    MOCK_METHOD(void, OnNegotiationStateChanged, (State state), (override));
    MOCK_METHOD(void, OnLocalOfferPublished, (), (override));
    MOCK_METHOD(void, OnTransportStateChanged, (PeerTransport::State state), (override));
    MOCK_METHOD(void, OnRemoteStreamArrived, (), (override));
    MOCK_METHOD(void, OnSessionError, (const SessionError& error), (override));
};

} // namespace

class T(NegotiationStateMachineTest) : public ::testing::Test {
protected:
    T(NegotiationStateMachineTest)() 
        : time_controller_(Timestamp::Seconds(1000)),
          queue_(time_controller_.CreateTaskQueue()),
          bus_(hub_.Join(kChannelName, queue_.get())),
          peer_bus_(hub_.Join(kChannelName, queue_.get())),
          factory_(queue_.get()),
          media_devices_(queue_.get()) {
        media_devices_.set_delay(kMediaDelay);
        peer_subscription_ = signaling::ScopedSubscription(peer_bus_.get(), peer_bus_->Subscribe([this](const Message& message){
            // Skips what the peer sent itself.
            if (message.sender_role != peer_role_) {
                received_.push_back(message);
            }
        }));
    }

    void CreateMachine(SessionConfiguration config = SessionConfiguration()) {
        NegotiationStateMachine::Dependencies dependencies;
        dependencies.signaling_bus = bus_.get();
        dependencies.transport_factory = &factory_;
        dependencies.media_devices = &media_devices_;
        dependencies.media_surface = &media_surface_;
        machine_ = std::make_unique<NegotiationStateMachine>(config, dependencies, queue_.get(), &observer_);
    }

    void ChangeRole(Role role) {
        peer_role_ = role == Role::INITIATOR ? Role::RESPONDER : Role::INITIATOR;
        queue_->Post([this, role](){
            machine_->OnRoleChanged(role);
        });
        time_controller_.RunPending();
    }

    void PeerPublish(const Message& message) {
        peer_bus_->Publish(message);
        time_controller_.RunPending();
    }

    std::vector<Message> ReceivedOf(Message::Kind kind) const {
        std::vector<Message> messages;
        for (const auto& message : received_) {
            if (message.kind == kind) {
                messages.push_back(message);
            }
        }
        return messages;
    }

    // Starts as initiator and waits for the offer.
    void StartAsInitiator() {
        ChangeRole(Role::INITIATOR);
        time_controller_.AdvanceTime(kMediaDelay);
        ASSERT_EQ(ReceivedOf(Message::Kind::OFFER).size(), 1u);
    }

    void ConnectAsInitiator() {
        StartAsInitiator();
        PeerPublish(Message::Answer(CreatePeerDescription(sdp::Type::ANSWER), Role::RESPONDER));
        PeerPublish(Message::Candidate(CreatePeerCandidate(1), Role::RESPONDER));
        time_controller_.AdvanceTime(kConnectDelay);
        ASSERT_EQ(machine_->state(), State::CONNECTED);
    }

    SimulatedTimeController time_controller_;
    std::unique_ptr<TaskQueue> queue_;
    signaling::SignalingHub hub_;
    std::unique_ptr<signaling::LocalSignalingBus> bus_;
    std::unique_ptr<signaling::LocalSignalingBus> peer_bus_;
    SimulatedPeerTransportFactory factory_;
    SimulatedMediaDevices media_devices_;
    SimulatedMediaSurface media_surface_;
    NiceMock<MockObserver> observer_;
    std::unique_ptr<NegotiationStateMachine> machine_;

    Role peer_role_ = Role::IDLE;
    signaling::ScopedSubscription peer_subscription_;
    std::vector<Message> received_;
};

MY_TEST_F(NegotiationStateMachineTest, InitiatorPublishesOfferThenCandidates) {
    CreateMachine();
    EXPECT_CALL(observer_, OnNegotiationStateChanged(State::AWAITING_ANSWER)).Times(1);
    EXPECT_CALL(observer_, OnLocalOfferPublished()).Times(1);

    ChangeRole(Role::INITIATOR);
    EXPECT_EQ(machine_->state(), State::AWAITING_ANSWER);
    EXPECT_TRUE(machine_->subscribed());
    // Waiting for the local media.
    EXPECT_EQ(machine_->connection(), nullptr);

    time_controller_.AdvanceTime(kMediaDelay);
    ASSERT_NE(machine_->connection(), nullptr);
    EXPECT_TRUE(machine_->connection()->has_local_description());
    EXPECT_NE(machine_->connection()->local_media(), nullptr);
    EXPECT_EQ(media_surface_.local_stream(), machine_->connection()->local_media());

    ASSERT_EQ(received_.size(), 3u);
    EXPECT_EQ(received_[0].kind, Message::Kind::OFFER);
    EXPECT_EQ(received_[0].sender_role, Role::INITIATOR);
    EXPECT_EQ(received_[1].kind, Message::Kind::CANDIDATE);
    EXPECT_EQ(received_[2].kind, Message::Kind::CANDIDATE);
    EXPECT_EQ(machine_->connection()->flushed_local_candidates().size(), 2u);

    // The echoes of the local candidates are not buffered as remote ones.
    EXPECT_EQ(machine_->connection()->pending_remote_candidate_count(), 0u);
}

MY_TEST_F(NegotiationStateMachineTest, ResponderAnswersOffer) {
    CreateMachine();
    ChangeRole(Role::RESPONDER);
    EXPECT_EQ(machine_->state(), State::AWAITING_OFFER);
    // Listening with a bare connection.
    ASSERT_NE(machine_->connection(), nullptr);
    EXPECT_EQ(machine_->connection()->local_media(), nullptr);

    PeerPublish(Message::Offer(CreatePeerDescription(sdp::Type::OFFER), Role::INITIATOR));
    EXPECT_EQ(machine_->state(), State::NEGOTIATING);
    EXPECT_TRUE(machine_->connection()->has_remote_description());
    EXPECT_TRUE(machine_->connection()->has_local_description());

    auto answers = ReceivedOf(Message::Kind::ANSWER);
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(answers[0].sender_role, Role::RESPONDER);
    auto answer = signaling::PayloadToDescription(answers[0].payload);
    EXPECT_EQ(answer.type(), sdp::Type::ANSWER);
    EXPECT_TRUE(answer.HasMid("0"));
    EXPECT_TRUE(answer.HasMid("1"));
}

MY_TEST_F(NegotiationStateMachineTest, ReplayBufferedCandidatesInArrivalOrder) {
    CreateMachine();
    ChangeRole(Role::RESPONDER);
    for (int i = 1; i <= 3; ++i) {
        PeerPublish(Message::Candidate(CreatePeerCandidate(i), Role::INITIATOR));
    }
    ASSERT_NE(machine_->connection(), nullptr);
    EXPECT_EQ(machine_->connection()->pending_remote_candidate_count(), 3u);
    auto* transport = factory_.last_transport();
    ASSERT_NE(transport, nullptr);
    EXPECT_TRUE(transport->remote_candidates().empty());

    PeerPublish(Message::Offer(CreatePeerDescription(sdp::Type::OFFER), Role::INITIATOR));
    EXPECT_EQ(machine_->connection()->pending_remote_candidate_count(), 0u);
    auto remote_candidates = transport->remote_candidates();
    ASSERT_EQ(remote_candidates.size(), 3u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(remote_candidates[i], CreatePeerCandidate(i + 1));
    }
}

MY_TEST_F(NegotiationStateMachineTest, InitiatorIgnoresOffer) {
    CreateMachine();
    StartAsInitiator();
    PeerPublish(Message::Offer(CreatePeerDescription(sdp::Type::OFFER), Role::RESPONDER));
    EXPECT_EQ(machine_->state(), State::AWAITING_ANSWER);
    EXPECT_FALSE(machine_->connection()->has_remote_description());
}

MY_TEST_F(NegotiationStateMachineTest, ResponderIgnoresAnswer) {
    CreateMachine();
    ChangeRole(Role::RESPONDER);
    PeerPublish(Message::Answer(CreatePeerDescription(sdp::Type::ANSWER), Role::INITIATOR));
    EXPECT_EQ(machine_->state(), State::AWAITING_OFFER);
    EXPECT_FALSE(machine_->connection()->has_remote_description());
    EXPECT_TRUE(ReceivedOf(Message::Kind::ANSWER).empty());
}

MY_TEST_F(NegotiationStateMachineTest, IgnoreCandidateWithoutConnection) {
    CreateMachine();
    ChangeRole(Role::INITIATOR);
    // The local media is not acquired yet.
    PeerPublish(Message::Candidate(CreatePeerCandidate(1), Role::RESPONDER));
    time_controller_.AdvanceTime(kMediaDelay);
    ASSERT_NE(machine_->connection(), nullptr);
    EXPECT_EQ(machine_->connection()->pending_remote_candidate_count(), 0u);
}

MY_TEST_F(NegotiationStateMachineTest, IdleProcessesNothing) {
    CreateMachine();
    PeerPublish(Message::Offer(CreatePeerDescription(sdp::Type::OFFER), Role::INITIATOR));
    EXPECT_EQ(machine_->state(), State::IDLE);
    EXPECT_FALSE(machine_->subscribed());
    EXPECT_EQ(factory_.created_count(), 0u);
}

MY_TEST_F(NegotiationStateMachineTest, RejectedAnswerRevertsToAwaitingAnswer) {
    CreateMachine();
    StartAsInitiator();

    EXPECT_CALL(observer_, OnNegotiationStateChanged(State::NEGOTIATING)).Times(2);
    EXPECT_CALL(observer_, OnNegotiationStateChanged(State::AWAITING_ANSWER)).Times(1);
    EXPECT_CALL(observer_, OnSessionError(SessionError{SessionError::Kind::SIGNALING, kRemoteDescriptionRejectedMessage})).Times(1);
    EXPECT_CALL(observer_, OnNegotiationStateChanged(State::CLOSED)).Times(0);

    PeerPublish(Message::Answer(CreatePeerDescription(sdp::Type::ANSWER, false), Role::RESPONDER));
    EXPECT_EQ(machine_->state(), State::AWAITING_ANSWER);
    EXPECT_FALSE(machine_->connection()->has_remote_description());

    PeerPublish(Message::Answer(CreatePeerDescription(sdp::Type::ANSWER), Role::RESPONDER));
    EXPECT_EQ(machine_->state(), State::NEGOTIATING);
    EXPECT_TRUE(machine_->connection()->has_remote_description());
}

MY_TEST_F(NegotiationStateMachineTest, IgnoreMalformedPayload) {
    CreateMachine();
    ChangeRole(Role::RESPONDER);
    Message offer = Message::Offer(CreatePeerDescription(sdp::Type::OFFER), Role::INITIATOR);
    offer.payload["sdp"] = "not a session description";
    PeerPublish(offer);
    EXPECT_EQ(machine_->state(), State::AWAITING_OFFER);

    Message candidate = Message::Candidate(CreatePeerCandidate(1), Role::INITIATOR);
    candidate.payload["candidate"] = "candidate:1 1 udp";
    PeerPublish(candidate);
    EXPECT_EQ(machine_->connection()->pending_remote_candidate_count(), 0u);
}

MY_TEST_F(NegotiationStateMachineTest, DropDescriptionOfUnexpectedType) {
    CreateMachine();
    ChangeRole(Role::RESPONDER);
    EXPECT_CALL(observer_, OnNegotiationStateChanged(State::NEGOTIATING)).Times(1);
    EXPECT_CALL(observer_, OnSessionError(_)).Times(0);

    // An offer envelope carrying an answer.
    PeerPublish(Message::Offer(CreatePeerDescription(sdp::Type::ANSWER), Role::INITIATOR));
    EXPECT_EQ(machine_->state(), State::AWAITING_OFFER);
    EXPECT_FALSE(machine_->connection()->has_remote_description());
    EXPECT_TRUE(ReceivedOf(Message::Kind::ANSWER).empty());

    PeerPublish(Message::Offer(CreatePeerDescription(sdp::Type::OFFER), Role::INITIATOR));
    EXPECT_EQ(machine_->state(), State::NEGOTIATING);
    EXPECT_EQ(ReceivedOf(Message::Kind::ANSWER).size(), 1u);
}

MY_TEST_F(NegotiationStateMachineTest, SkipBufferedCandidateRejectedByTransport) {
    CreateMachine();
    ChangeRole(Role::RESPONDER);
    EXPECT_CALL(observer_, OnSessionError(_)).Times(0);

    // No media section with mid 9 in the offer.
    PeerPublish(Message::Candidate(sdp::Candidate("candidate:peer9 1 udp 2122260223 10.0.0.2 6009 typ host", "9", 0), Role::INITIATOR));
    PeerPublish(Message::Candidate(CreatePeerCandidate(1), Role::INITIATOR));
    ASSERT_EQ(machine_->connection()->pending_remote_candidate_count(), 2u);

    PeerPublish(Message::Offer(CreatePeerDescription(sdp::Type::OFFER), Role::INITIATOR));
    EXPECT_EQ(machine_->state(), State::NEGOTIATING);
    EXPECT_EQ(machine_->connection()->pending_remote_candidate_count(), 0u);
    auto* transport = factory_.last_transport();
    ASSERT_NE(transport, nullptr);
    auto remote_candidates = transport->remote_candidates();
    ASSERT_EQ(remote_candidates.size(), 1u);
    EXPECT_EQ(remote_candidates[0], CreatePeerCandidate(1));
    EXPECT_TRUE(machine_->subscribed());
}

MY_TEST_F(NegotiationStateMachineTest, SkipCandidateRejectedByTransport) {
    CreateMachine();
    ChangeRole(Role::RESPONDER);
    EXPECT_CALL(observer_, OnSessionError(_)).Times(0);

    PeerPublish(Message::Offer(CreatePeerDescription(sdp::Type::OFFER), Role::INITIATOR));
    ASSERT_TRUE(machine_->connection()->has_remote_description());

    PeerPublish(Message::Candidate(sdp::Candidate("candidate:peer9 1 udp 2122260223 10.0.0.2 6009 typ host", "9", 0), Role::INITIATOR));
    EXPECT_EQ(machine_->state(), State::NEGOTIATING);
    PeerPublish(Message::Candidate(CreatePeerCandidate(2), Role::INITIATOR));
    auto remote_candidates = factory_.last_transport()->remote_candidates();
    ASSERT_EQ(remote_candidates.size(), 1u);
    EXPECT_EQ(remote_candidates[0], CreatePeerCandidate(2));

    time_controller_.AdvanceTime(kConnectDelay);
    EXPECT_EQ(machine_->state(), State::CONNECTED);
}

MY_TEST_F(NegotiationStateMachineTest, DropOfferWhileStepInFlight) {
    CreateMachine();
    ChangeRole(Role::RESPONDER);
    // Both arrive before the first one is applied.
    peer_bus_->Publish(Message::Offer(CreatePeerDescription(sdp::Type::OFFER), Role::INITIATOR));
    peer_bus_->Publish(Message::Offer(CreatePeerDescription(sdp::Type::OFFER), Role::INITIATOR));
    time_controller_.RunPending();
    EXPECT_EQ(ReceivedOf(Message::Kind::ANSWER).size(), 1u);
    EXPECT_EQ(machine_->state(), State::NEGOTIATING);
}

MY_TEST_F(NegotiationStateMachineTest, RoundTripConnects) {
    CreateMachine();
    EXPECT_CALL(observer_, OnNegotiationStateChanged(State::CONNECTED)).Times(1);
    EXPECT_CALL(observer_, OnTransportStateChanged(PeerTransport::State::CONNECTING)).Times(1);
    EXPECT_CALL(observer_, OnTransportStateChanged(PeerTransport::State::CONNECTED)).Times(1);
    EXPECT_CALL(observer_, OnRemoteStreamArrived()).Times(1);

    ConnectAsInitiator();
    EXPECT_EQ(machine_->connection()->state(), PeerTransport::State::CONNECTED);
    ASSERT_NE(media_surface_.remote_stream(), nullptr);
    EXPECT_TRUE(media_surface_.remote_stream()->HasVideo());

    // Late candidates are not published once connected.
    size_t candidate_count = ReceivedOf(Message::Kind::CANDIDATE).size();
    EXPECT_EQ(candidate_count, 2u);
}

MY_TEST_F(NegotiationStateMachineTest, TransportFailureCloses) {
    CreateMachine();
    ConnectAsInitiator();
    auto local_media = machine_->connection()->local_media();

    EXPECT_CALL(observer_, OnNegotiationStateChanged(State::CLOSED)).Times(1);
    EXPECT_CALL(observer_, OnSessionError(Field(&SessionError::kind, SessionError::Kind::TRANSPORT))).Times(1);
    factory_.last_transport()->SimulateFailure();
    time_controller_.RunPending();

    EXPECT_EQ(machine_->state(), State::CLOSED);
    EXPECT_EQ(machine_->connection(), nullptr);
    EXPECT_FALSE(machine_->subscribed());
    EXPECT_TRUE(local_media->stopped());
    EXPECT_EQ(media_surface_.local_stream(), nullptr);
    EXPECT_EQ(media_surface_.remote_stream(), nullptr);
    // Holds the role until the session ends.
    EXPECT_EQ(machine_->role(), Role::INITIATOR);
}

MY_TEST_F(NegotiationStateMachineTest, DisconnectCloses) {
    CreateMachine();
    ChangeRole(Role::RESPONDER);
    PeerPublish(Message::Offer(CreatePeerDescription(sdp::Type::OFFER), Role::INITIATOR));
    PeerPublish(Message::Candidate(CreatePeerCandidate(1), Role::INITIATOR));
    time_controller_.AdvanceTime(kConnectDelay);
    ASSERT_EQ(machine_->state(), State::CONNECTED);

    factory_.last_transport()->SimulateDisconnect();
    time_controller_.RunPending();
    EXPECT_EQ(machine_->state(), State::CLOSED);
    EXPECT_EQ(factory_.live_count(), 0u);
}

MY_TEST_F(NegotiationStateMachineTest, EndSessionEqualsFreshIdle) {
    CreateMachine();
    ConnectAsInitiator();
    auto local_media = machine_->connection()->local_media();
    const uint64_t connected_epoch = machine_->epoch();

    ChangeRole(Role::IDLE);
    EXPECT_EQ(machine_->state(), State::IDLE);
    EXPECT_EQ(machine_->connection(), nullptr);
    EXPECT_FALSE(machine_->subscribed());
    EXPECT_TRUE(local_media->stopped());
    EXPECT_EQ(factory_.live_count(), 0u);
    EXPECT_EQ(media_surface_.local_stream(), nullptr);

    // Messages of the ended session are ignored.
    PeerPublish(Message::Answer(CreatePeerDescription(sdp::Type::ANSWER), Role::RESPONDER));
    EXPECT_EQ(machine_->state(), State::IDLE);

    received_.clear();
    StartAsInitiator();
    EXPECT_GT(machine_->epoch(), connected_epoch);
    EXPECT_EQ(factory_.created_count(), 2u);
    EXPECT_EQ(factory_.live_count(), 1u);
    EXPECT_EQ(machine_->state(), State::AWAITING_ANSWER);
}

MY_TEST_F(NegotiationStateMachineTest, EndSessionStopsLateMedia) {
    CreateMachine();
    ChangeRole(Role::INITIATOR);
    ChangeRole(Role::IDLE);
    time_controller_.AdvanceTime(kMediaDelay);

    auto streams = media_devices_.streams();
    ASSERT_EQ(streams.size(), 1u);
    EXPECT_TRUE(streams[0]->stopped());
    EXPECT_EQ(factory_.created_count(), 0u);
    EXPECT_EQ(media_surface_.local_stream(), nullptr);
    EXPECT_TRUE(received_.empty());
}

MY_TEST_F(NegotiationStateMachineTest, EndSessionCancelsInFlightStep) {
    CreateMachine();
    ChangeRole(Role::RESPONDER);
    peer_bus_->Publish(Message::Offer(CreatePeerDescription(sdp::Type::OFFER), Role::INITIATOR));
    // Ends right after the offer is handed to the transport.
    queue_->Post([this](){
        machine_->OnRoleChanged(Role::IDLE);
    });
    time_controller_.RunPending();

    EXPECT_EQ(machine_->state(), State::IDLE);
    EXPECT_TRUE(ReceivedOf(Message::Kind::ANSWER).empty());
    EXPECT_EQ(factory_.live_count(), 0u);
}

MY_TEST_F(NegotiationStateMachineTest, MediaDeniedReportsError) {
    media_devices_.set_deny(true);
    CreateMachine();
    EXPECT_CALL(observer_, OnSessionError(SessionError{SessionError::Kind::LOCAL_MEDIA_DENIED, kLocalMediaDeniedMessage})).Times(1);
    ChangeRole(Role::INITIATOR);
    time_controller_.AdvanceTime(kMediaDelay);
    EXPECT_EQ(factory_.created_count(), 0u);
    EXPECT_EQ(machine_->connection(), nullptr);
    EXPECT_TRUE(received_.empty());
}

MY_TEST_F(NegotiationStateMachineTest, TransportCreationFailureReleasesLocalMedia) {
    factory_.set_fail_create(true);
    CreateMachine();
    EXPECT_CALL(observer_, OnSessionError(Field(&SessionError::kind, SessionError::Kind::TRANSPORT))).Times(1);
    ChangeRole(Role::INITIATOR);
    time_controller_.AdvanceTime(kMediaDelay);

    EXPECT_EQ(machine_->state(), State::CLOSED);
    EXPECT_EQ(machine_->connection(), nullptr);
    auto streams = media_devices_.streams();
    ASSERT_EQ(streams.size(), 1u);
    EXPECT_TRUE(streams[0]->stopped());
    EXPECT_EQ(media_surface_.local_stream(), nullptr);
    EXPECT_TRUE(received_.empty());

    ChangeRole(Role::IDLE);
    EXPECT_EQ(media_surface_.local_stream(), nullptr);
}

MY_TEST_F(NegotiationStateMachineTest, ConnectTimeoutClosesAsTransportFailure) {
    SimulatedPeerTransport::Options options;
    options.auto_connect = false;
    factory_.set_options(options);
    SessionConfiguration config;
    config.connect_timeout = TimeDelta::Seconds(5);
    CreateMachine(config);

    StartAsInitiator();
    PeerPublish(Message::Answer(CreatePeerDescription(sdp::Type::ANSWER), Role::RESPONDER));
    ASSERT_EQ(machine_->state(), State::NEGOTIATING);

    EXPECT_CALL(observer_, OnSessionError(Field(&SessionError::kind, SessionError::Kind::TRANSPORT))).Times(1);
    time_controller_.AdvanceTime(TimeDelta::Seconds(4));
    EXPECT_EQ(machine_->state(), State::NEGOTIATING);
    time_controller_.AdvanceTime(TimeDelta::Seconds(1));
    EXPECT_EQ(machine_->state(), State::CLOSED);
}

MY_TEST_F(NegotiationStateMachineTest, ConnectTimeoutCancelledWhenConnected) {
    SessionConfiguration config;
    config.connect_timeout = TimeDelta::Seconds(5);
    CreateMachine(config);
    ConnectAsInitiator();
    EXPECT_CALL(observer_, OnSessionError(_)).Times(0);
    time_controller_.AdvanceTime(TimeDelta::Seconds(10));
    EXPECT_EQ(machine_->state(), State::CONNECTED);
}

MY_TEST_F(NegotiationStateMachineTest, AnswerCreationFailureCloses) {
    SimulatedPeerTransport::Options options;
    options.fail_create_answer = true;
    factory_.set_options(options);
    CreateMachine();
    ChangeRole(Role::RESPONDER);

    EXPECT_CALL(observer_, OnSessionError(Field(&SessionError::kind, SessionError::Kind::TRANSPORT))).Times(1);
    PeerPublish(Message::Offer(CreatePeerDescription(sdp::Type::OFFER), Role::INITIATOR));
    EXPECT_EQ(machine_->state(), State::CLOSED);
    EXPECT_TRUE(ReceivedOf(Message::Kind::ANSWER).empty());
}

} // namespace test
} // namespace pairrtc
