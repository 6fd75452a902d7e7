#include "testing/simulated_media.hpp"

#include <plog/Log.h>

#include <string>

namespace pairrtc {
namespace {

constexpr int kStillWidth = 640;
constexpr int kStillHeight = 480;

} // namespace

// SimulatedMediaDevices
SimulatedMediaDevices::SimulatedMediaDevices(TaskQueue* task_queue) 
    : task_queue_(task_queue) {}

SimulatedMediaDevices::~SimulatedMediaDevices() = default;

void SimulatedMediaDevices::set_deny(bool deny) {
    std::lock_guard<std::mutex> lock(mutex_);
    deny_ = deny;
}

void SimulatedMediaDevices::set_delay(TimeDelta delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    delay_ = delay;
}

size_t SimulatedMediaDevices::request_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_count_;
}

std::vector<std::shared_ptr<MediaStream>> SimulatedMediaDevices::streams() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streams_;
}

void SimulatedMediaDevices::GetUserMedia(const MediaConstraints& constraints,
                                         SuccessCallback on_success,
                                         FailureCallback on_failure) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++request_count_;
    if (deny_) {
        task_queue_->PostDelayed(delay_, ToQueuedTask(task_safety_, [on_failure=std::move(on_failure)](){
            on_failure(std::make_exception_ptr(MediaAccessError("Permission denied.")));
        }));
        return;
    }
    auto stream = std::make_shared<MediaStream>("local-" + std::to_string(request_count_));
    if (constraints.audio) {
        stream->AddTrack(std::make_shared<MediaStreamTrack>(MediaStreamTrack::Kind::AUDIO, stream->id() + "-audio"));
    }
    if (constraints.video) {
        stream->AddTrack(std::make_shared<MediaStreamTrack>(MediaStreamTrack::Kind::VIDEO, stream->id() + "-video"));
    }
    streams_.push_back(stream);
    task_queue_->PostDelayed(delay_, ToQueuedTask(task_safety_, [stream, on_success=std::move(on_success)](){
        on_success(stream);
    }));
}

// SimulatedMediaSurface
SimulatedMediaSurface::SimulatedMediaSurface() = default;

SimulatedMediaSurface::~SimulatedMediaSurface() = default;

std::shared_ptr<MediaStream> SimulatedMediaSurface::local_stream() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_stream_;
}

std::shared_ptr<MediaStream> SimulatedMediaSurface::remote_stream() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remote_stream_;
}

size_t SimulatedMediaSurface::capture_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capture_count_;
}

void SimulatedMediaSurface::AttachLocalStream(std::shared_ptr<MediaStream> stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    local_stream_ = std::move(stream);
}

void SimulatedMediaSurface::AttachRemoteStream(std::shared_ptr<MediaStream> stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    remote_stream_ = std::move(stream);
}

void SimulatedMediaSurface::Detach(Slot slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (slot == Slot::LOCAL) {
        local_stream_.reset();
    } else {
        remote_stream_.reset();
    }
}

std::optional<StillImage> SimulatedMediaSurface::CaptureStill(Slot slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& stream = slot == Slot::LOCAL ? local_stream_ : remote_stream_;
    if (!stream || stream->stopped() || !stream->HasVideo()) {
        return std::nullopt;
    }
    ++capture_count_;
    StillImage still;
    still.width = kStillWidth;
    still.height = kStillHeight;
    const std::string tag = stream->id() + "#" + std::to_string(capture_count_);
    still.data.assign(tag.begin(), tag.end());
    return still;
}

} // namespace pairrtc
