#include "rtc/base/task_utils/pending_task_safety_flag.hpp"

namespace pairrtc {

std::shared_ptr<PendingTaskSafetyFlag> PendingTaskSafetyFlag::CreateDetached() {
    auto safety_flag = std::shared_ptr<PendingTaskSafetyFlag>(new PendingTaskSafetyFlag(true));
    safety_flag->sequence_checker_.Detach();
    return safety_flag;
}

bool PendingTaskSafetyFlag::alive() const {
    RTC_RUN_ON(&sequence_checker_);
    return alive_;
}

// NOTE: Owners may be destroyed off the queue once it stopped running tasks,
// so this is not bound to the attached sequence.
void PendingTaskSafetyFlag::SetNotAlive() {
    alive_ = false;
}

} // namespace pairrtc
