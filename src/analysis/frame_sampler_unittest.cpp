#include "analysis/frame_sampler.hpp"
#include "testing/simulated_time_controller.hpp"
#include "testing/simulated_media.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

namespace pairrtc {
namespace test {
namespace {

constexpr TimeDelta kInterval = TimeDelta::Millis(800);

std::shared_ptr<MediaStream> CreateVideoStream() {
    auto stream = std::make_shared<MediaStream>("camera");
    stream->AddTrack(std::make_shared<MediaStreamTrack>(MediaStreamTrack::Kind::VIDEO, "camera-video"));
    return stream;
}

} // namespace

class T(FrameSamplerTest) : public ::testing::Test {
protected:
    T(FrameSamplerTest)() 
        : time_controller_(Timestamp::Seconds(1000)),
          queue_(time_controller_.CreateTaskQueue()),
          sampler_(&surface_, queue_.get()) {}

    void Sample(MediaSurface::Slot slot, size_t frame_count) {
        queue_->Post([this, slot, frame_count](){
            sampler_.Sample(slot, frame_count, kInterval, [this](std::vector<StillImage> frames){
                frames_ = std::move(frames);
                completed_at_ = time_controller_.CurrentTime();
            }, [this](std::exception_ptr exp){
                failure_ = exp;
            });
        });
        time_controller_.RunPending();
    }

    SimulatedTimeController time_controller_;
    std::unique_ptr<TaskQueue> queue_;
    SimulatedMediaSurface surface_;
    FrameSampler sampler_;

    std::optional<std::vector<StillImage>> frames_;
    std::optional<Timestamp> completed_at_;
    std::exception_ptr failure_ = nullptr;
};

MY_TEST_F(FrameSamplerTest, CaptureBurstWithInterval) {
    surface_.AttachRemoteStream(CreateVideoStream());
    const Timestamp start_time = time_controller_.CurrentTime();
    Sample(MediaSurface::Slot::REMOTE, 3);
    // The first frame is captured immediately.
    EXPECT_EQ(surface_.capture_count(), 1u);
    EXPECT_TRUE(sampler_.sampling());

    time_controller_.AdvanceTime(kInterval);
    EXPECT_EQ(surface_.capture_count(), 2u);
    time_controller_.AdvanceTime(kInterval);
    EXPECT_EQ(surface_.capture_count(), 3u);
    EXPECT_FALSE(frames_.has_value());

    // Waits an interval after the last capture.
    time_controller_.AdvanceTime(kInterval);
    ASSERT_TRUE(frames_.has_value());
    EXPECT_EQ(frames_->size(), 3u);
    EXPECT_EQ(*completed_at_, start_time + kInterval * 3);
    EXPECT_FALSE(sampler_.sampling());
    EXPECT_EQ(failure_, nullptr);
}

MY_TEST_F(FrameSamplerTest, FailWhenNothingRendering) {
    Sample(MediaSurface::Slot::LOCAL, 3);
    ASSERT_NE(failure_, nullptr);
    EXPECT_THROW(std::rethrow_exception(failure_), std::runtime_error);
    EXPECT_FALSE(sampler_.sampling());
}

MY_TEST_F(FrameSamplerTest, FailWhenStreamDetachedMidway) {
    surface_.AttachLocalStream(CreateVideoStream());
    Sample(MediaSurface::Slot::LOCAL, 3);
    surface_.Detach(MediaSurface::Slot::LOCAL);
    time_controller_.AdvanceTime(kInterval);
    EXPECT_NE(failure_, nullptr);
    EXPECT_FALSE(frames_.has_value());
}

MY_TEST_F(FrameSamplerTest, RejectOverlappingSampling) {
    surface_.AttachLocalStream(CreateVideoStream());
    Sample(MediaSurface::Slot::LOCAL, 2);
    bool thrown = false;
    queue_->Post([&](){
        try {
            sampler_.Sample(MediaSurface::Slot::LOCAL, 2, kInterval, nullptr, nullptr);
        } catch (const std::logic_error&) {
            thrown = true;
        }
    });
    time_controller_.RunPending();
    EXPECT_TRUE(thrown);
}

} // namespace test
} // namespace pairrtc
