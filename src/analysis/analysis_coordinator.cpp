#include "analysis/analysis_coordinator.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace pairrtc {

AnalysisCoordinator::AnalysisCoordinator(const Configuration& config,
                                         FrameSource* frame_source,
                                         FrameAnalysisService* analysis_service,
                                         Clock* clock,
                                         TaskQueue* task_queue,
                                         ResultCallback result_callback,
                                         ErrorCallback error_callback) 
    : config_(config),
      analysis_service_(analysis_service),
      clock_(clock),
      task_queue_(task_queue),
      result_callback_(std::move(result_callback)),
      error_callback_(std::move(error_callback)),
      sampler_(frame_source, task_queue) {
    if (!analysis_service_ || !clock_) {
        throw std::invalid_argument("Analysis requires a service and a clock.");
    }
}

AnalysisCoordinator::~AnalysisCoordinator() = default;

void AnalysisCoordinator::RequestAnalysis(const SessionStatus& status) {
    RTC_RUN_ON(task_queue_);
    if (in_flight_) {
        PLOG_DEBUG << "Ignored analysis request, the previous one is in flight.";
        return;
    }
    if (!status.live) {
        PLOG_WARNING << "Rejected analysis request while not live.";
        error_callback_({SessionError::Kind::ANALYSIS, kAnalysisNotLiveMessage});
        return;
    }
    const auto slot = status.role == Role::INITIATOR ? MediaSurface::Slot::LOCAL 
                                                     : MediaSurface::Slot::REMOTE;
    in_flight_ = true;
    PLOG_INFO << "Sampling " << config_.frame_count << " frames for analysis.";
    sampler_.Sample(slot, config_.frame_count, config_.frame_interval, 
        [this](std::vector<StillImage> frames){
            OnFramesSampled(std::move(frames));
        }, 
        [this](std::exception_ptr exp){
            OnAnalysisFailed(exp);
        });
}

// Private methods
void AnalysisCoordinator::OnFramesSampled(std::vector<StillImage> frames) {
    analysis_service_->Analyze(std::move(frames), 
        [this, task_queue=task_queue_, flag=task_safety_.flag()](std::string json_text){
            task_queue->Post(ToQueuedTask(flag, [this, json_text=std::move(json_text)](){
                OnAnalysisCompleted(json_text);
            }));
        }, 
        [this, task_queue=task_queue_, flag=task_safety_.flag()](std::exception_ptr exp){
            task_queue->Post(ToQueuedTask(flag, [this, exp](){
                OnAnalysisFailed(exp);
            }));
        });
}

void AnalysisCoordinator::OnAnalysisCompleted(const std::string& json_text) {
    RTC_RUN_ON(task_queue_);
    try {
        history_.insert(history_.begin(), ParseAnalysisResult(json_text, clock_->now_ms()));
    } catch (const std::invalid_argument&) {
        OnAnalysisFailed(std::current_exception());
        return;
    }
    in_flight_ = false;
    PLOG_INFO << "Analysis completed, threat level: " << history_.front().threat_level;
    result_callback_(history_.front(), history_);
}

void AnalysisCoordinator::OnAnalysisFailed(std::exception_ptr exp) {
    RTC_RUN_ON(task_queue_);
    try {
        if (exp) {
            std::rethrow_exception(exp);
        }
    } catch (const std::exception& e) {
        PLOG_WARNING << "Analysis failed: " << e.what();
    }
    in_flight_ = false;
    error_callback_({SessionError::Kind::ANALYSIS, kAnalysisFailedMessage});
}

} // namespace pairrtc
