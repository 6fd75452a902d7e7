#include "session/connection_lifecycle_tracker.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

#include <vector>

namespace pairrtc {
namespace test {

class T(ConnectionLifecycleTrackerTest) : public ::testing::Test {
protected:
    T(ConnectionLifecycleTrackerTest)() 
        : tracker_([this](const SessionStatus& status){
            published_.push_back(status);
          }) {}

    ConnectionLifecycleTracker tracker_;
    std::vector<SessionStatus> published_;
};

MY_TEST_F(ConnectionLifecycleTrackerTest, InitiatorIsLiveOptimistically) {
    tracker_.OnRoleChanged(Role::INITIATOR);
    ASSERT_EQ(published_.size(), 1u);
    EXPECT_FALSE(published_.back().live);

    tracker_.OnLocalOfferPublished();
    ASSERT_EQ(published_.size(), 2u);
    EXPECT_TRUE(published_.back().live);
    EXPECT_FALSE(published_.back().failed);
    EXPECT_EQ(published_.back().link_status, LinkStatus::OPTIMISTICALLY_LIVE);

    tracker_.OnTransportStateChanged(PeerTransport::State::CONNECTED);
    ASSERT_EQ(published_.size(), 3u);
    EXPECT_TRUE(published_.back().live);
    EXPECT_EQ(published_.back().link_status, LinkStatus::CONFIRMED_CONNECTED);
}

MY_TEST_F(ConnectionLifecycleTrackerTest, ResponderIsNotLiveOptimistically) {
    tracker_.OnRoleChanged(Role::RESPONDER);
    tracker_.OnLocalOfferPublished();
    ASSERT_EQ(published_.size(), 1u);
    EXPECT_EQ(tracker_.status().link_status, LinkStatus::STANDBY);

    tracker_.OnRemoteStreamArrived();
    ASSERT_EQ(published_.size(), 2u);
    EXPECT_TRUE(published_.back().live);
    EXPECT_EQ(published_.back().role, Role::RESPONDER);
}

MY_TEST_F(ConnectionLifecycleTrackerTest, PublishOnlyOnChange) {
    tracker_.OnRoleChanged(Role::RESPONDER);
    tracker_.OnTransportStateChanged(PeerTransport::State::CONNECTING);
    tracker_.OnTransportStateChanged(PeerTransport::State::CONNECTED);
    tracker_.OnRemoteStreamArrived();
    tracker_.OnTransportStateChanged(PeerTransport::State::CONNECTED);
    EXPECT_EQ(published_.size(), 2u);
}

MY_TEST_F(ConnectionLifecycleTrackerTest, FailureLeavesStandby) {
    tracker_.OnRoleChanged(Role::INITIATOR);
    tracker_.OnTransportStateChanged(PeerTransport::State::CONNECTED);
    tracker_.OnTransportStateChanged(PeerTransport::State::FAILED);
    EXPECT_FALSE(tracker_.status().live);
    EXPECT_TRUE(tracker_.status().failed);
    EXPECT_EQ(tracker_.status().link_status, LinkStatus::STANDBY);

    // Closed after the failure changes nothing.
    size_t published_count = published_.size();
    tracker_.OnNegotiationClosed();
    EXPECT_EQ(published_.size(), published_count);

    // A failed initiator is not live optimistically.
    tracker_.OnLocalOfferPublished();
    EXPECT_FALSE(tracker_.status().live);
}

MY_TEST_F(ConnectionLifecycleTrackerTest, RoleChangeResetsStatus) {
    tracker_.OnRoleChanged(Role::INITIATOR);
    tracker_.OnNegotiationClosed();
    EXPECT_TRUE(tracker_.status().failed);

    tracker_.OnRoleChanged(Role::IDLE);
    SessionStatus expected;
    EXPECT_EQ(tracker_.status(), expected);

    // Idle never goes live.
    tracker_.OnRemoteStreamArrived();
    EXPECT_EQ(tracker_.status(), expected);
}

} // namespace test
} // namespace pairrtc
