#include "signaling/signaling_hub.hpp"
#include "testing/simulated_time_controller.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

#include <vector>

namespace pairrtc {
namespace test {

using signaling::Message;
using signaling::ScopedSubscription;

namespace {

constexpr char kChannelName[] = "test_channel";

Message CreateCandidateMessage(int index, Role role) {
    sdp::Candidate candidate("candidate:" + std::to_string(index) + " 1 udp 100 10.0.0.1 " + std::to_string(5000 + index) + " typ host", "0", 0);
    return Message::Candidate(candidate, role);
}

int CandidateIndex(const Message& message) {
    return std::stoi(signaling::PayloadToCandidate(message.payload).foundation());
}
    
} // namespace

class T(SignalingHubTest) : public ::testing::Test {
protected:
    T(SignalingHubTest)() 
        : time_controller_(Timestamp::Seconds(1000)),
          queue_a_(time_controller_.CreateTaskQueue()),
          queue_b_(time_controller_.CreateTaskQueue()),
          bus_a_(hub_.Join(kChannelName, queue_a_.get())),
          bus_b_(hub_.Join(kChannelName, queue_b_.get())) {}

    SimulatedTimeController time_controller_;
    std::unique_ptr<TaskQueue> queue_a_;
    std::unique_ptr<TaskQueue> queue_b_;
    signaling::SignalingHub hub_;
    std::unique_ptr<signaling::LocalSignalingBus> bus_a_;
    std::unique_ptr<signaling::LocalSignalingBus> bus_b_;
};

MY_TEST_F(SignalingHubTest, DeliverToEverySubscriberIncludingSender) {
    std::vector<Message::Kind> received_a;
    std::vector<Message::Kind> received_b;
    ScopedSubscription sub_a(bus_a_.get(), bus_a_->Subscribe([&](const Message& message){
        EXPECT_TRUE(queue_a_->IsCurrent());
        received_a.push_back(message.kind);
    }));
    ScopedSubscription sub_b(bus_b_.get(), bus_b_->Subscribe([&](const Message& message){
        EXPECT_TRUE(queue_b_->IsCurrent());
        received_b.push_back(message.kind);
    }));

    bus_a_->Publish(CreateCandidateMessage(1, Role::INITIATOR));
    // Delivered asynchronously.
    EXPECT_TRUE(received_a.empty());
    time_controller_.RunPending();

    EXPECT_EQ(received_a.size(), 1u);
    EXPECT_EQ(received_b.size(), 1u);
}

MY_TEST_F(SignalingHubTest, FifoPerSender) {
    std::vector<int> received;
    ScopedSubscription sub(bus_b_.get(), bus_b_->Subscribe([&](const Message& message){
        received.push_back(CandidateIndex(message));
    }));

    for (int i = 1; i <= 5; ++i) {
        bus_a_->Publish(CreateCandidateMessage(i, Role::INITIATOR));
    }
    time_controller_.RunPending();

    EXPECT_EQ(received, std::vector<int>({1, 2, 3, 4, 5}));
}

MY_TEST_F(SignalingHubTest, NoDeliveryAfterUnsubscribe) {
    int received = 0;
    ScopedSubscription sub(bus_b_.get(), bus_b_->Subscribe([&](const Message&){
        ++received;
    }));

    bus_a_->Publish(CreateCandidateMessage(1, Role::INITIATOR));
    // Unsubscribed before the delivery runs.
    sub.Reset();
    EXPECT_FALSE(sub.active());
    time_controller_.RunPending();

    EXPECT_EQ(received, 0);
}

MY_TEST_F(SignalingHubTest, MovedSubscriptionStaysActive) {
    int received = 0;
    ScopedSubscription sub;
    EXPECT_FALSE(sub.active());
    {
        ScopedSubscription temp(bus_b_.get(), bus_b_->Subscribe([&](const Message&){
            ++received;
        }));
        sub = std::move(temp);
    }
    EXPECT_TRUE(sub.active());

    bus_a_->Publish(CreateCandidateMessage(1, Role::INITIATOR));
    time_controller_.RunPending();
    EXPECT_EQ(received, 1);
}

MY_TEST_F(SignalingHubTest, DropUndecodableText) {
    int received = 0;
    ScopedSubscription sub(bus_b_.get(), bus_b_->Subscribe([&](const Message&){
        ++received;
    }));

    bus_a_->PublishText("{\"kind\":\"Hello\"}");
    bus_a_->PublishText("garbage");
    bus_a_->Publish(CreateCandidateMessage(1, Role::INITIATOR));
    time_controller_.RunPending();

    EXPECT_EQ(received, 1);
}

MY_TEST_F(SignalingHubTest, PublishAfterCloseIsDropped) {
    int received = 0;
    ScopedSubscription sub(bus_b_.get(), bus_b_->Subscribe([&](const Message&){
        ++received;
    }));

    bus_a_->Close();
    EXPECT_TRUE(bus_a_->closed());
    EXPECT_EQ(hub_.endpoint_count(kChannelName), 1u);

    bus_a_->Publish(CreateCandidateMessage(1, Role::INITIATOR));
    time_controller_.RunPending();
    EXPECT_EQ(received, 0);
}

MY_TEST_F(SignalingHubTest, ChannelsAreIsolated) {
    SimulatedTimeController time_controller(Timestamp::Seconds(1000));
    auto queue = time_controller.CreateTaskQueue();
    auto other_bus = hub_.Join("other_channel", queue.get());
    int received = 0;
    ScopedSubscription sub(other_bus.get(), other_bus->Subscribe([&](const Message&){
        ++received;
    }));

    bus_a_->Publish(CreateCandidateMessage(1, Role::INITIATOR));
    time_controller_.RunPending();
    time_controller.RunPending();
    EXPECT_EQ(received, 0);
}

MY_TEST_F(SignalingHubTest, DestroyedEndpointLeavesChannel) {
    bus_b_.reset();
    EXPECT_EQ(hub_.endpoint_count(kChannelName), 1u);
    bus_a_->Publish(CreateCandidateMessage(1, Role::INITIATOR));
    time_controller_.RunPending();
}

} // namespace test
} // namespace pairrtc
