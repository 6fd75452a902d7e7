#include "session/session.hpp"
#include "signaling/signaling_hub.hpp"
#include "testing/simulated_time_controller.hpp"
#include "testing/simulated_peer_transport.hpp"
#include "testing/simulated_media.hpp"
#include "testing/simulated_analysis_service.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

#include <optional>
#include <type_traits>
#include <vector>

namespace pairrtc {
namespace test {
namespace {

using State = NegotiationStateMachine::State;

constexpr TimeDelta kNegotiationTime = TimeDelta::Seconds(1);
constexpr TimeDelta kAnalysisTime = TimeDelta::Seconds(3);

// Participant bundles a session with its simulated collaborators.
struct Participant {
    Participant(SimulatedTimeController* time_controller, 
                signaling::SignalingHub* hub, 
                const SessionConfiguration& config) 
        : time_controller(time_controller),
          queue(time_controller->CreateTaskQueue()),
          bus(hub->Join(config.channel_name, queue.get())),
          factory(queue.get()),
          media_devices(queue.get()),
          analysis_service(queue.get()) {
        Session::Dependencies dependencies;
        dependencies.signaling_bus = bus.get();
        dependencies.transport_factory = &factory;
        dependencies.media_devices = &media_devices;
        dependencies.media_surface = &surface;
        dependencies.frame_source = &surface;
        dependencies.analysis_service = &analysis_service;
        dependencies.clock = time_controller->GetClock();
        session = std::make_unique<Session>(config, dependencies, queue.get());
        session->OnStatusChanged([this](const SessionStatus& status){
            statuses.push_back(status);
        });
        session->OnError([this](const SessionError& error){
            errors.push_back(error);
        });
        session->OnAnalysisResult([this](const AnalysisResult& latest, const std::vector<AnalysisResult>& history){
            results.push_back(latest);
            history_size = history.size();
        });
    }

    // Runs `getter` on the session queue.
    template <typename Getter>
    auto Query(Getter getter) -> typename std::decay<decltype(getter())>::type {
        std::optional<typename std::decay<decltype(getter())>::type> result;
        queue->Post([&](){
            result.emplace(getter());
        });
        time_controller->RunPending();
        return *result;
    }

    Role role() { return Query([this](){ return session->role(); }); }
    State state() { return Query([this](){ return session->negotiation_state(); }); }
    SessionStatus status() { return Query([this](){ return session->status(); }); }
    std::vector<AnalysisResult> history() { return Query([this](){ return session->analysis_history(); }); }

    SimulatedTimeController* const time_controller;
    std::unique_ptr<TaskQueue> queue;
    std::unique_ptr<signaling::LocalSignalingBus> bus;
    SimulatedPeerTransportFactory factory;
    SimulatedMediaDevices media_devices;
    SimulatedMediaSurface surface;
    SimulatedAnalysisService analysis_service;

    std::vector<SessionStatus> statuses;
    std::vector<SessionError> errors;
    std::vector<AnalysisResult> results;
    size_t history_size = 0;

    std::unique_ptr<Session> session;
};

} // namespace

class T(SessionTest) : public ::testing::Test {
protected:
    T(SessionTest)() 
        : time_controller_(Timestamp::Seconds(1000)),
          alice_(std::make_unique<Participant>(&time_controller_, &hub_, config_)),
          bob_(std::make_unique<Participant>(&time_controller_, &hub_, config_)) {}

    void Connect() {
        alice_->session->StartAsInitiator();
        bob_->session->JoinAsResponder();
        time_controller_.AdvanceTime(kNegotiationTime);
        ASSERT_EQ(alice_->state(), State::CONNECTED);
        ASSERT_EQ(bob_->state(), State::CONNECTED);
    }

    SimulatedTimeController time_controller_;
    signaling::SignalingHub hub_;
    SessionConfiguration config_;
    std::unique_ptr<Participant> alice_;
    std::unique_ptr<Participant> bob_;
};

MY_TEST_F(SessionTest, InitiatorAndResponderConnect) {
    alice_->session->StartAsInitiator();
    bob_->session->JoinAsResponder();
    time_controller_.RunPending();
    EXPECT_EQ(alice_->role(), Role::INITIATOR);
    EXPECT_EQ(alice_->state(), State::AWAITING_ANSWER);
    EXPECT_EQ(bob_->role(), Role::RESPONDER);
    EXPECT_EQ(bob_->state(), State::AWAITING_OFFER);

    time_controller_.AdvanceTime(kNegotiationTime);
    EXPECT_EQ(alice_->state(), State::CONNECTED);
    EXPECT_EQ(bob_->state(), State::CONNECTED);
    EXPECT_TRUE(alice_->status().live);
    EXPECT_TRUE(bob_->status().live);
    EXPECT_FALSE(alice_->status().failed);

    // The initiator went live eagerly before the link was confirmed.
    ASSERT_EQ(alice_->statuses.size(), 3u);
    EXPECT_EQ(alice_->statuses[1].link_status, LinkStatus::OPTIMISTICALLY_LIVE);
    EXPECT_EQ(alice_->statuses[2].link_status, LinkStatus::CONFIRMED_CONNECTED);
    ASSERT_EQ(bob_->statuses.size(), 2u);
    EXPECT_EQ(bob_->statuses[1].link_status, LinkStatus::CONFIRMED_CONNECTED);

    EXPECT_NE(alice_->surface.remote_stream(), nullptr);
    EXPECT_NE(bob_->surface.remote_stream(), nullptr);
    EXPECT_TRUE(alice_->errors.empty());
    EXPECT_TRUE(bob_->errors.empty());
}

MY_TEST_F(SessionTest, ResponderAppliesCandidatesInOrder) {
    Connect();
    auto* alice_transport = alice_->factory.last_transport();
    auto* bob_transport = bob_->factory.last_transport();
    ASSERT_NE(alice_transport, nullptr);
    ASSERT_NE(bob_transport, nullptr);
    // Arrived before the offer was applied, buffered and replayed.
    EXPECT_EQ(bob_transport->remote_candidates(), alice_transport->local_candidates());
    EXPECT_EQ(alice_transport->remote_candidates(), bob_transport->local_candidates());
    EXPECT_EQ(alice_transport->remote_candidates().size(), 2u);
}

MY_TEST_F(SessionTest, EntryPointsIgnoredWhenNotIdle) {
    alice_->session->StartAsInitiator();
    alice_->session->JoinAsResponder();
    alice_->session->StartAsInitiator();
    time_controller_.AdvanceTime(kNegotiationTime);
    EXPECT_EQ(alice_->role(), Role::INITIATOR);
    EXPECT_EQ(alice_->media_devices.request_count(), 1u);
    EXPECT_EQ(alice_->factory.created_count(), 1u);
}

MY_TEST_F(SessionTest, MediaDeniedRevertsToIdle) {
    alice_->media_devices.set_deny(true);
    alice_->session->StartAsInitiator();
    time_controller_.AdvanceTime(kNegotiationTime);

    ASSERT_EQ(alice_->errors.size(), 1u);
    EXPECT_EQ(alice_->errors[0].kind, SessionError::Kind::LOCAL_MEDIA_DENIED);
    EXPECT_EQ(alice_->errors[0].message, kLocalMediaDeniedMessage);
    EXPECT_EQ(alice_->role(), Role::IDLE);
    EXPECT_EQ(alice_->state(), State::IDLE);
    EXPECT_EQ(alice_->factory.created_count(), 0u);
    EXPECT_EQ(alice_->status(), SessionStatus());

    // Retry once the access is granted.
    alice_->media_devices.set_deny(false);
    bob_->session->JoinAsResponder();
    alice_->session->StartAsInitiator();
    time_controller_.AdvanceTime(kNegotiationTime);
    EXPECT_EQ(alice_->state(), State::CONNECTED);
}

MY_TEST_F(SessionTest, EndSessionReleasesResources) {
    Connect();
    auto local_stream = alice_->surface.local_stream();
    ASSERT_NE(local_stream, nullptr);

    alice_->session->EndSession();
    time_controller_.RunPending();
    EXPECT_EQ(alice_->role(), Role::IDLE);
    EXPECT_EQ(alice_->state(), State::IDLE);
    EXPECT_EQ(alice_->status(), SessionStatus());
    EXPECT_EQ(alice_->factory.live_count(), 0u);
    EXPECT_TRUE(local_stream->stopped());
    EXPECT_EQ(alice_->surface.local_stream(), nullptr);
    EXPECT_EQ(alice_->surface.remote_stream(), nullptr);
}

MY_TEST_F(SessionTest, NegotiateAgainAfterEndSession) {
    Connect();
    alice_->session->EndSession();
    bob_->session->EndSession();
    time_controller_.RunPending();

    bob_->session->JoinAsResponder();
    alice_->session->StartAsInitiator();
    time_controller_.AdvanceTime(kNegotiationTime);
    EXPECT_EQ(alice_->state(), State::CONNECTED);
    EXPECT_EQ(bob_->state(), State::CONNECTED);
    EXPECT_EQ(alice_->factory.created_count(), 2u);
    EXPECT_EQ(alice_->factory.live_count(), 1u);
}

MY_TEST_F(SessionTest, TransportFailureSurfacedAsStatus) {
    Connect();
    alice_->factory.last_transport()->SimulateFailure();
    time_controller_.RunPending();

    SessionStatus status = alice_->status();
    EXPECT_FALSE(status.live);
    EXPECT_TRUE(status.failed);
    EXPECT_EQ(status.role, Role::INITIATOR);
    EXPECT_EQ(alice_->state(), State::CLOSED);
    ASSERT_EQ(alice_->errors.size(), 1u);
    EXPECT_EQ(alice_->errors[0].kind, SessionError::Kind::TRANSPORT);

    alice_->session->EndSession();
    time_controller_.RunPending();
    EXPECT_FALSE(alice_->status().failed);
    EXPECT_EQ(alice_->role(), Role::IDLE);
}

MY_TEST_F(SessionTest, AnalysisRequiresLiveConnection) {
    alice_->session->RequestAnalysis();
    time_controller_.RunPending();
    ASSERT_EQ(alice_->errors.size(), 1u);
    EXPECT_EQ(alice_->errors[0].kind, SessionError::Kind::ANALYSIS);
    EXPECT_EQ(alice_->errors[0].message, kAnalysisNotLiveMessage);
    EXPECT_EQ(alice_->analysis_service.call_count(), 0u);
}

MY_TEST_F(SessionTest, AnalysisSamplesRelevantSurface) {
    Connect();
    bob_->session->RequestAnalysis();
    time_controller_.AdvanceTime(kAnalysisTime);
    ASSERT_EQ(bob_->results.size(), 1u);
    EXPECT_EQ(bob_->analysis_service.last_frame_count(), 3u);
    EXPECT_EQ(bob_->results[0].summary, "A person is sitting at a desk.");
    EXPECT_EQ(bob_->results[0].threat_level, AnalysisResult::Severity::LOW);
    EXPECT_EQ(bob_->surface.capture_count(), 3u);

    alice_->session->RequestAnalysis();
    time_controller_.AdvanceTime(kAnalysisTime);
    ASSERT_EQ(alice_->results.size(), 1u);
    EXPECT_EQ(alice_->surface.capture_count(), 3u);
}

MY_TEST_F(SessionTest, AnalysisHistoryNewestFirst) {
    Connect();
    alice_->session->RequestAnalysis();
    time_controller_.AdvanceTime(kAnalysisTime);
    alice_->analysis_service.set_response(R"({"summary": "Empty room.", "objects": [], "threatLevel": "Medium", "detailedLog": "Nobody."})");
    alice_->session->RequestAnalysis();
    time_controller_.AdvanceTime(kAnalysisTime);

    ASSERT_EQ(alice_->results.size(), 2u);
    EXPECT_EQ(alice_->history_size, 2u);
    auto history = alice_->history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].summary, "Empty room.");
    EXPECT_EQ(history[0].threat_level, AnalysisResult::Severity::MEDIUM);
    EXPECT_GT(history[0].timestamp_ms, history[1].timestamp_ms);
}

MY_TEST_F(SessionTest, AnalysisAtMostOneInFlight) {
    Connect();
    alice_->session->RequestAnalysis();
    alice_->session->RequestAnalysis();
    time_controller_.AdvanceTime(kAnalysisTime);
    EXPECT_EQ(alice_->analysis_service.call_count(), 1u);
    EXPECT_EQ(alice_->results.size(), 1u);
    EXPECT_TRUE(alice_->errors.empty());
}

MY_TEST_F(SessionTest, AnalysisFailureKeepsSession) {
    Connect();
    alice_->analysis_service.set_failure(true);
    alice_->session->RequestAnalysis();
    time_controller_.AdvanceTime(kAnalysisTime);
    ASSERT_EQ(alice_->errors.size(), 1u);
    EXPECT_EQ(alice_->errors[0], (SessionError{SessionError::Kind::ANALYSIS, kAnalysisFailedMessage}));
    EXPECT_EQ(alice_->state(), State::CONNECTED);
    EXPECT_TRUE(alice_->status().live);

    // No automatic retry, but the user may try again.
    EXPECT_EQ(alice_->analysis_service.call_count(), 1u);
    alice_->analysis_service.set_failure(false);
    alice_->session->RequestAnalysis();
    time_controller_.AdvanceTime(kAnalysisTime);
    EXPECT_EQ(alice_->results.size(), 1u);
}

MY_TEST_F(SessionTest, MalformedAnalysisResponseReported) {
    Connect();
    alice_->analysis_service.set_response(R"({"summary": "Missing the rest."})");
    alice_->session->RequestAnalysis();
    time_controller_.AdvanceTime(kAnalysisTime);
    ASSERT_EQ(alice_->errors.size(), 1u);
    EXPECT_EQ(alice_->errors[0].kind, SessionError::Kind::ANALYSIS);
    EXPECT_TRUE(alice_->results.empty());
}

} // namespace test
} // namespace pairrtc
