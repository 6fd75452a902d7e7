#include "analysis/frame_sampler.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace pairrtc {

FrameSampler::FrameSampler(FrameSource* frame_source, TaskQueue* task_queue) 
    : frame_source_(frame_source),
      task_queue_(task_queue) {
    if (!frame_source_) {
        throw std::invalid_argument("Frame sampler requires a frame source.");
    }
}

FrameSampler::~FrameSampler() = default;

void FrameSampler::Sample(MediaSurface::Slot slot, 
                          size_t frame_count, 
                          TimeDelta interval, 
                          SuccessCallback on_success, 
                          FailureCallback on_failure) {
    RTC_RUN_ON(task_queue_);
    if (request_) {
        throw std::logic_error("Frame sampling is already in progress.");
    }
    if (frame_count == 0) {
        throw std::invalid_argument("Frame count must be positive.");
    }
    request_.emplace(Request{slot, frame_count, interval, std::move(on_success), std::move(on_failure), {}});
    request_->frames.reserve(frame_count);
    CaptureNext();
}

// Private methods
void FrameSampler::CaptureNext() {
    auto frame = frame_source_->CaptureStill(request_->slot);
    if (!frame) {
        PLOG_WARNING << "No frame to capture after " << request_->frames.size() << " frames.";
        auto on_failure = std::move(request_->on_failure);
        request_.reset();
        on_failure(std::make_exception_ptr(std::runtime_error("Nothing is rendering in the sampled surface.")));
        return;
    }
    request_->frames.push_back(std::move(*frame));
    PLOG_VERBOSE << "Captured frame " << request_->frames.size() << "/" << request_->frame_count;
    task_queue_->PostDelayed(request_->interval, ToQueuedTask(task_safety_, [this](){
        OnIntervalElapsed();
    }));
}

void FrameSampler::OnIntervalElapsed() {
    RTC_RUN_ON(task_queue_);
    if (!request_) {
        return;
    }
    if (request_->frames.size() < request_->frame_count) {
        CaptureNext();
        return;
    }
    auto frames = std::move(request_->frames);
    auto on_success = std::move(request_->on_success);
    request_.reset();
    on_success(std::move(frames));
}

} // namespace pairrtc
