#ifndef _ANALYSIS_ANALYSIS_COORDINATOR_H_
#define _ANALYSIS_ANALYSIS_COORDINATOR_H_

#include "base/defines.hpp"
#include "analysis/analysis_result.hpp"
#include "analysis/frame_analysis_service.hpp"
#include "analysis/frame_sampler.hpp"
#include "session/session_error.hpp"
#include "session/session_status.hpp"
#include "rtc/base/time/clock.hpp"
#include "rtc/base/task_utils/task_queue.hpp"
#include "rtc/base/task_utils/pending_task_safety_flag.hpp"

#include <functional>
#include <vector>

namespace pairrtc {

// AnalysisCoordinator runs at most one analysis at a time, and keeps
// the results newest first. It MUST be used on `task_queue`.
class AnalysisCoordinator {
public:
    struct Configuration {
        size_t frame_count = 3;
        TimeDelta frame_interval = TimeDelta::Millis(800);
    };
    using ResultCallback = std::function<void(const AnalysisResult& latest, 
                                              const std::vector<AnalysisResult>& history)>;
    using ErrorCallback = std::function<void(const SessionError& error)>;
public:
    AnalysisCoordinator(const Configuration& config,
                        FrameSource* frame_source,
                        FrameAnalysisService* analysis_service,
                        Clock* clock,
                        TaskQueue* task_queue,
                        ResultCallback result_callback,
                        ErrorCallback error_callback);
    ~AnalysisCoordinator();

    bool in_flight() const { return in_flight_; }
    const std::vector<AnalysisResult>& history() const { return history_; }

    // Samples the local surface for the initiator and the remote
    // one for the responder.
    void RequestAnalysis(const SessionStatus& status);

private:
    void OnFramesSampled(std::vector<StillImage> frames);
    void OnAnalysisCompleted(const std::string& json_text);
    void OnAnalysisFailed(std::exception_ptr exp);

private:
    DISALLOW_COPY_AND_ASSIGN(AnalysisCoordinator);
    const Configuration config_;
    FrameAnalysisService* const analysis_service_;
    Clock* const clock_;
    TaskQueue* const task_queue_;
    ResultCallback result_callback_;
    ErrorCallback error_callback_;

    FrameSampler sampler_;
    bool in_flight_ = false;
    std::vector<AnalysisResult> history_;

    ScopedTaskSafety task_safety_;
};

} // namespace pairrtc

#endif
