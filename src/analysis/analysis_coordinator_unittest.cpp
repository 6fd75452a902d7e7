#include "analysis/analysis_coordinator.hpp"
#include "testing/simulated_time_controller.hpp"
#include "testing/simulated_media.hpp"
#include "testing/simulated_analysis_service.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

#include <vector>

namespace pairrtc {
namespace test {
namespace {

constexpr TimeDelta kAnalysisTime = TimeDelta::Seconds(3);

SessionStatus LiveStatus(Role role) {
    SessionStatus status;
    status.role = role;
    status.live = true;
    status.link_status = LinkStatus::CONFIRMED_CONNECTED;
    return status;
}

std::shared_ptr<MediaStream> CreateVideoStream(const std::string& id) {
    auto stream = std::make_shared<MediaStream>(id);
    stream->AddTrack(std::make_shared<MediaStreamTrack>(MediaStreamTrack::Kind::VIDEO, id + "-video"));
    return stream;
}

} // namespace

class T(AnalysisCoordinatorTest) : public ::testing::Test {
protected:
    T(AnalysisCoordinatorTest)() 
        : time_controller_(Timestamp::Seconds(1000)),
          queue_(time_controller_.CreateTaskQueue()),
          analysis_service_(queue_.get()),
          coordinator_(AnalysisCoordinator::Configuration(), 
                       &surface_, 
                       &analysis_service_, 
                       time_controller_.GetClock(), 
                       queue_.get(), 
                       [this](const AnalysisResult& latest, const std::vector<AnalysisResult>& history){
                           results_.push_back(latest);
                           history_size_ = history.size();
                       }, 
                       [this](const SessionError& error){
                           errors_.push_back(error);
                       }) {}

    void Request(const SessionStatus& status) {
        queue_->Post([this, status](){
            coordinator_.RequestAnalysis(status);
        });
        time_controller_.RunPending();
    }

    SimulatedTimeController time_controller_;
    std::unique_ptr<TaskQueue> queue_;
    SimulatedMediaSurface surface_;
    SimulatedAnalysisService analysis_service_;
    std::vector<AnalysisResult> results_;
    std::vector<SessionError> errors_;
    size_t history_size_ = 0;
    AnalysisCoordinator coordinator_;
};

MY_TEST_F(AnalysisCoordinatorTest, RejectWhenNotLive) {
    Request(SessionStatus());
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].message, kAnalysisNotLiveMessage);
    EXPECT_FALSE(coordinator_.in_flight());
}

MY_TEST_F(AnalysisCoordinatorTest, StampResultWithCurrentTime) {
    surface_.AttachLocalStream(CreateVideoStream("local"));
    Request(LiveStatus(Role::INITIATOR));
    EXPECT_TRUE(coordinator_.in_flight());
    time_controller_.AdvanceTime(kAnalysisTime);

    ASSERT_EQ(results_.size(), 1u);
    // 3 frames spaced 800 ms, and the service replies in 200 ms.
    EXPECT_EQ(results_[0].timestamp_ms, Timestamp::Seconds(1000).ms() + 2600);
    EXPECT_EQ(history_size_, 1u);
    EXPECT_FALSE(coordinator_.in_flight());
}

MY_TEST_F(AnalysisCoordinatorTest, ResponderSamplesRemoteSurface) {
    surface_.AttachLocalStream(CreateVideoStream("local"));
    Request(LiveStatus(Role::RESPONDER));
    time_controller_.AdvanceTime(kAnalysisTime);
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].message, kAnalysisFailedMessage);
    EXPECT_EQ(analysis_service_.call_count(), 0u);

    surface_.AttachRemoteStream(CreateVideoStream("remote"));
    Request(LiveStatus(Role::RESPONDER));
    time_controller_.AdvanceTime(kAnalysisTime);
    EXPECT_EQ(results_.size(), 1u);
}

MY_TEST_F(AnalysisCoordinatorTest, KeepHistoryNewestFirst) {
    surface_.AttachLocalStream(CreateVideoStream("local"));
    for (const char* level : {"Low", "Medium", "High"}) {
        analysis_service_.set_response(std::string(R"({"summary": "s", "objects": [], "threatLevel": ")") + 
                                       level + R"(", "detailedLog": "d"})");
        Request(LiveStatus(Role::INITIATOR));
        time_controller_.AdvanceTime(kAnalysisTime);
    }
    const auto& history = coordinator_.history();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].threat_level, AnalysisResult::Severity::HIGH);
    EXPECT_EQ(history[1].threat_level, AnalysisResult::Severity::MEDIUM);
    EXPECT_EQ(history[2].threat_level, AnalysisResult::Severity::LOW);
}

} // namespace test
} // namespace pairrtc
