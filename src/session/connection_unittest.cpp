#include "session/connection.hpp"
#include "testing/simulated_time_controller.hpp"
#include "testing/simulated_peer_transport.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

#include <vector>

namespace pairrtc {
namespace test {
namespace {

constexpr uint64_t kEpoch = 7;

sdp::Description CreateRemoteDescription(sdp::Type type) {
    return sdp::Description::Builder(type)
        .set_ice_ufrag("rmt1")
        .set_ice_pwd("remotepassword0123456789")
        .set_fingerprint("AB:CD:EF:01:23:45:67:89")
        .AddMedia(sdp::Description::Media::Kind::AUDIO, "0")
        .AddMedia(sdp::Description::Media::Kind::VIDEO, "1")
        .Build();
}

sdp::Candidate CreateRemoteCandidate(int index) {
    return sdp::Candidate("candidate:" + std::to_string(index) + " 1 udp 2122260223 10.0.0.2 " + 
                          std::to_string(6000 + index) + " typ host", "0", 0);
}

std::shared_ptr<MediaStream> CreateLocalStream() {
    auto stream = std::make_shared<MediaStream>("local");
    stream->AddTrack(std::make_shared<MediaStreamTrack>(MediaStreamTrack::Kind::AUDIO, "local-audio"));
    stream->AddTrack(std::make_shared<MediaStreamTrack>(MediaStreamTrack::Kind::VIDEO, "local-video"));
    return stream;
}

} // namespace

class T(ConnectionTest) : public ::testing::Test {
protected:
    T(ConnectionTest)() 
        : time_controller_(Timestamp::Seconds(1000)),
          queue_(time_controller_.CreateTaskQueue()),
          factory_(queue_.get()) {}

    void CreateConnection(Role role) {
        connection_ = std::make_unique<Connection>(kEpoch, role, factory_.CreatePeerTransport(RtcConfiguration()), queue_.get(), 
            [this](uint64_t epoch, Connection::Event event){
                EXPECT_EQ(epoch, kEpoch);
                events_.push_back(std::move(event));
            });
        transport_ = factory_.last_transport();
    }

    void ApplyRemoteDescription(sdp::Type type) {
        connection_->ApplyRemoteDescription(CreateRemoteDescription(type), [this](){
            ++applied_count_;
        }, [this](std::exception_ptr exp){
            failures_.push_back(exp);
        });
        time_controller_.RunPending();
    }

    SimulatedTimeController time_controller_;
    std::unique_ptr<TaskQueue> queue_;
    SimulatedPeerTransportFactory factory_;
    std::unique_ptr<Connection> connection_;
    SimulatedPeerTransport* transport_ = nullptr;
    std::vector<Connection::Event> events_;
    std::vector<std::exception_ptr> failures_;
    int applied_count_ = 0;
};

MY_TEST_F(ConnectionTest, BufferRemoteCandidatesUntilRemoteDescription) {
    CreateConnection(Role::RESPONDER);
    for (int i = 1; i <= 3; ++i) {
        connection_->AddRemoteCandidate(CreateRemoteCandidate(i));
    }
    EXPECT_EQ(connection_->pending_remote_candidate_count(), 3u);
    EXPECT_TRUE(transport_->remote_candidates().empty());

    ApplyRemoteDescription(sdp::Type::OFFER);
    EXPECT_EQ(applied_count_, 1);
    EXPECT_TRUE(connection_->has_remote_description());
    EXPECT_EQ(connection_->pending_remote_candidate_count(), 0u);

    // Replayed in arrival order.
    auto remote_candidates = transport_->remote_candidates();
    ASSERT_EQ(remote_candidates.size(), 3u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(remote_candidates[i], CreateRemoteCandidate(i + 1));
    }

    // Applied immediately from now on.
    connection_->AddRemoteCandidate(CreateRemoteCandidate(4));
    EXPECT_EQ(connection_->pending_remote_candidate_count(), 0u);
    EXPECT_EQ(transport_->remote_candidates().size(), 4u);
}

MY_TEST_F(ConnectionTest, RejectRemoteDescriptionOfWrongType) {
    CreateConnection(Role::RESPONDER);
    ApplyRemoteDescription(sdp::Type::ANSWER);
    ASSERT_EQ(failures_.size(), 1u);
    EXPECT_THROW(std::rethrow_exception(failures_[0]), std::logic_error);
    EXPECT_FALSE(connection_->has_remote_description());
    EXPECT_EQ(applied_count_, 0);
}

MY_TEST_F(ConnectionTest, InitiatorAppliesAnswerAfterLocalOffer) {
    CreateConnection(Role::INITIATOR);
    ApplyRemoteDescription(sdp::Type::ANSWER);
    ASSERT_EQ(failures_.size(), 1u);

    std::optional<sdp::Description> local_sdp;
    connection_->AttachLocalMedia(CreateLocalStream());
    connection_->CreateLocalDescription([&](sdp::Description description){
        local_sdp.emplace(description);
    }, [](std::exception_ptr){
        FAIL() << "Failed to create offer.";
    });
    time_controller_.RunPending();
    ASSERT_TRUE(local_sdp.has_value());
    EXPECT_EQ(local_sdp->type(), sdp::Type::OFFER);
    EXPECT_TRUE(local_sdp->HasAudio());
    EXPECT_TRUE(local_sdp->HasVideo());

    ApplyRemoteDescription(sdp::Type::ANSWER);
    EXPECT_EQ(applied_count_, 1);
    EXPECT_EQ(connection_->expected_remote_type(), sdp::Type::ANSWER);
}

MY_TEST_F(ConnectionTest, ResponderCannotAnswerBeforeOffer) {
    CreateConnection(Role::RESPONDER);
    bool failed = false;
    connection_->CreateLocalDescription([](sdp::Description){
        FAIL() << "Answer created without offer.";
    }, [&](std::exception_ptr exp){
        failed = true;
        EXPECT_THROW(std::rethrow_exception(exp), std::logic_error);
    });
    EXPECT_TRUE(failed);
}

MY_TEST_F(ConnectionTest, LocalDescriptionCreatedOnlyOnce) {
    CreateConnection(Role::INITIATOR);
    int created_count = 0;
    int failed_count = 0;
    auto on_success = [&](sdp::Description){ ++created_count; };
    auto on_failure = [&](std::exception_ptr){ ++failed_count; };
    connection_->CreateLocalDescription(on_success, on_failure);
    connection_->CreateLocalDescription(on_success, on_failure);
    time_controller_.RunPending();
    connection_->CreateLocalDescription(on_success, on_failure);
    EXPECT_EQ(created_count, 1);
    EXPECT_EQ(failed_count, 2);
}

MY_TEST_F(ConnectionTest, GatheredCandidatesPostedAsEvents) {
    CreateConnection(Role::INITIATOR);
    connection_->CreateLocalDescription([](sdp::Description){}, [](std::exception_ptr){});
    time_controller_.RunPending();

    size_t candidate_count = 0;
    for (auto& event : events_) {
        if (auto* gathered = std::get_if<Connection::CandidateGathered>(&event)) {
            ++candidate_count;
            EXPECT_EQ(gathered->candidate.type(), sdp::Candidate::Type::HOST);
        }
    }
    EXPECT_EQ(candidate_count, 2u);
}

MY_TEST_F(ConnectionTest, DetectLocalEchoes) {
    CreateConnection(Role::INITIATOR);
    std::optional<sdp::Description> local_sdp;
    connection_->CreateLocalDescription([&](sdp::Description description){
        local_sdp.emplace(description);
    }, [](std::exception_ptr){});
    time_controller_.RunPending();
    ASSERT_TRUE(local_sdp.has_value());
    EXPECT_TRUE(connection_->IsLocalEcho(*local_sdp));
    EXPECT_FALSE(connection_->IsLocalEcho(CreateRemoteDescription(sdp::Type::ANSWER)));

    auto candidate = CreateRemoteCandidate(1);
    EXPECT_FALSE(connection_->IsLocalEcho(candidate));
    connection_->RecordFlushedCandidate(candidate);
    EXPECT_TRUE(connection_->IsLocalEcho(candidate));
    EXPECT_EQ(connection_->flushed_local_candidates().size(), 1u);
}

MY_TEST_F(ConnectionTest, DestroyStopsLocalMediaAndDropsCompletions) {
    CreateConnection(Role::INITIATOR);
    auto stream = CreateLocalStream();
    connection_->AttachLocalMedia(stream);
    EXPECT_THROW(connection_->AttachLocalMedia(CreateLocalStream()), std::logic_error);

    bool completed = false;
    connection_->CreateLocalDescription([&](sdp::Description){
        completed = true;
    }, [&](std::exception_ptr){
        completed = true;
    });
    connection_.reset();
    EXPECT_TRUE(stream->stopped());
    EXPECT_EQ(factory_.live_count(), 0u);

    time_controller_.RunPending();
    EXPECT_FALSE(completed);
    EXPECT_TRUE(events_.empty());
}

} // namespace test
} // namespace pairrtc
