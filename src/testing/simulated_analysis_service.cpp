#include "testing/simulated_analysis_service.hpp"

#include <stdexcept>

namespace pairrtc {

const char SimulatedAnalysisService::kDefaultResponse[] = 
    R"({"summary": "A person is sitting at a desk.",)"
    R"( "objects": ["person", "desk", "laptop"],)"
    R"( "threatLevel": "Low",)"
    R"( "detailedLog": "The person types on the laptop and looks at the camera."})";

SimulatedAnalysisService::SimulatedAnalysisService(TaskQueue* task_queue) 
    : task_queue_(task_queue) {}

SimulatedAnalysisService::~SimulatedAnalysisService() = default;

void SimulatedAnalysisService::set_response(std::string json_text) {
    std::lock_guard<std::mutex> lock(mutex_);
    response_ = std::move(json_text);
}

void SimulatedAnalysisService::set_failure(bool failure) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_ = failure;
}

void SimulatedAnalysisService::set_delay(TimeDelta delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    delay_ = delay;
}

size_t SimulatedAnalysisService::call_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return call_count_;
}

size_t SimulatedAnalysisService::last_frame_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_frame_count_;
}

void SimulatedAnalysisService::Analyze(std::vector<StillImage> frames, 
                                       SuccessCallback on_success, 
                                       FailureCallback on_failure) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++call_count_;
    last_frame_count_ = frames.size();
    if (failure_) {
        task_queue_->PostDelayed(delay_, ToQueuedTask(task_safety_, [on_failure=std::move(on_failure)](){
            on_failure(std::make_exception_ptr(std::runtime_error("API key not valid.")));
        }));
        return;
    }
    task_queue_->PostDelayed(delay_, ToQueuedTask(task_safety_, [response=response_, on_success=std::move(on_success)](){
        on_success(response);
    }));
}

} // namespace pairrtc
