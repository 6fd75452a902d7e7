#ifndef _TESTING_SIMULATED_ANALYSIS_SERVICE_H_
#define _TESTING_SIMULATED_ANALYSIS_SERVICE_H_

#include "base/defines.hpp"
#include "analysis/frame_analysis_service.hpp"
#include "rtc/base/task_utils/task_queue.hpp"
#include "rtc/base/task_utils/pending_task_safety_flag.hpp"
#include "rtc/base/units/time_delta.hpp"

#include <mutex>
#include <string>

namespace pairrtc {

// SimulatedAnalysisService replies with a canned response after `delay`.
class SimulatedAnalysisService final : public FrameAnalysisService {
public:
    static const char kDefaultResponse[];
public:
    explicit SimulatedAnalysisService(TaskQueue* task_queue);
    ~SimulatedAnalysisService() override;

    void set_response(std::string json_text);
    void set_failure(bool failure);
    void set_delay(TimeDelta delay);
    size_t call_count() const;
    size_t last_frame_count() const;

    void Analyze(std::vector<StillImage> frames, 
                 SuccessCallback on_success, 
                 FailureCallback on_failure) override;

private:
    TaskQueue* const task_queue_;
    mutable std::mutex mutex_;
    std::string response_ = kDefaultResponse;
    bool failure_ = false;
    TimeDelta delay_ = TimeDelta::Millis(200);
    size_t call_count_ = 0;
    size_t last_frame_count_ = 0;

    ScopedTaskSafety task_safety_;
};

} // namespace pairrtc

#endif
