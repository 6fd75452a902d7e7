#ifndef _ANALYSIS_FRAME_SAMPLER_H_
#define _ANALYSIS_FRAME_SAMPLER_H_

#include "base/defines.hpp"
#include "rtc/base/task_utils/task_queue.hpp"
#include "rtc/base/task_utils/pending_task_safety_flag.hpp"
#include "rtc/base/units/time_delta.hpp"
#include "rtc/media/media_surface.hpp"

#include <exception>
#include <functional>
#include <optional>
#include <vector>

namespace pairrtc {

// FrameSampler captures a burst of stills, waiting `interval` after each
// capture. It MUST be used on `task_queue`.
class FrameSampler {
public:
    using SuccessCallback = std::function<void(std::vector<StillImage> frames)>;
    using FailureCallback = std::function<void(std::exception_ptr)>;
public:
    FrameSampler(FrameSource* frame_source, TaskQueue* task_queue);
    ~FrameSampler();

    bool sampling() const { return request_.has_value(); }

    // Throws std::logic_error if a sampling is in progress.
    void Sample(MediaSurface::Slot slot, 
                size_t frame_count, 
                TimeDelta interval, 
                SuccessCallback on_success, 
                FailureCallback on_failure);

private:
    void CaptureNext();
    void OnIntervalElapsed();

private:
    struct Request {
        MediaSurface::Slot slot;
        size_t frame_count;
        TimeDelta interval;
        SuccessCallback on_success;
        FailureCallback on_failure;
        std::vector<StillImage> frames;
    };

    DISALLOW_COPY_AND_ASSIGN(FrameSampler);
    FrameSource* const frame_source_;
    TaskQueue* const task_queue_;
    std::optional<Request> request_ = std::nullopt;

    ScopedTaskSafety task_safety_;
};

} // namespace pairrtc

#endif
