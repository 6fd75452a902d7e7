#ifndef _TESTING_SIMULATED_MEDIA_H_
#define _TESTING_SIMULATED_MEDIA_H_

#include "base/defines.hpp"
#include "rtc/base/task_utils/task_queue.hpp"
#include "rtc/base/task_utils/pending_task_safety_flag.hpp"
#include "rtc/base/units/time_delta.hpp"
#include "rtc/media/media_devices.hpp"
#include "rtc/media/media_surface.hpp"

#include <mutex>
#include <vector>

namespace pairrtc {

// SimulatedMediaDevices hands out streams with stub tracks after `delay`.
class SimulatedMediaDevices final : public MediaDevices {
public:
    explicit SimulatedMediaDevices(TaskQueue* task_queue);
    ~SimulatedMediaDevices() override;

    void set_deny(bool deny);
    void set_delay(TimeDelta delay);
    size_t request_count() const;
    std::vector<std::shared_ptr<MediaStream>> streams() const;

    void GetUserMedia(const MediaConstraints& constraints,
                      SuccessCallback on_success,
                      FailureCallback on_failure) override;

private:
    TaskQueue* const task_queue_;
    mutable std::mutex mutex_;
    bool deny_ = false;
    TimeDelta delay_ = TimeDelta::Millis(10);
    size_t request_count_ = 0;
    std::vector<std::shared_ptr<MediaStream>> streams_;

    ScopedTaskSafety task_safety_;
};

// SimulatedMediaSurface
class SimulatedMediaSurface final : public MediaSurface, 
                                    public FrameSource {
public:
    SimulatedMediaSurface();
    ~SimulatedMediaSurface() override;

    std::shared_ptr<MediaStream> local_stream() const;
    std::shared_ptr<MediaStream> remote_stream() const;
    size_t capture_count() const;

    // MediaSurface interface
    void AttachLocalStream(std::shared_ptr<MediaStream> stream) override;
    void AttachRemoteStream(std::shared_ptr<MediaStream> stream) override;
    void Detach(Slot slot) override;

    // FrameSource interface
    std::optional<StillImage> CaptureStill(Slot slot) override;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<MediaStream> local_stream_ = nullptr;
    std::shared_ptr<MediaStream> remote_stream_ = nullptr;
    size_t capture_count_ = 0;
};

} // namespace pairrtc

#endif
