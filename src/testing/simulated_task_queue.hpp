#ifndef _TESTING_SIMULATED_TASK_QUEUE_H_
#define _TESTING_SIMULATED_TASK_QUEUE_H_

#include "base/defines.hpp"
#include "rtc/base/task_utils/task_queue_impl.hpp"
#include "testing/simulated_sequence_runner.hpp"

#include <mutex>
#include <deque>
#include <map>
#include <vector>

namespace pairrtc {

class SimulatedTimeController;

// SimulatedTaskQueue
class SimulatedTaskQueue final : public TaskQueueImpl, 
                                 public SimulatedSequenceRunner {
public:
    explicit SimulatedTaskQueue(SimulatedTimeController* time_controller);

    // SimulatedSequenceRunner interface
    Timestamp GetNextRunTime() const override;
    void RunReady(Timestamp at_time) override;

    // TaskQueueImpl interface
    void Delete() override;
    void Post(std::unique_ptr<QueuedTask> task) override;
    void PostDelayed(TimeDelta delay, std::unique_ptr<QueuedTask> task) override;

private:
    ~SimulatedTaskQueue() override;

private:
    SimulatedTimeController* const time_controller_;

    mutable std::mutex lock_;

    using ReadyTaskDeque = std::deque<std::unique_ptr<QueuedTask>>;
    ReadyTaskDeque ready_tasks_;
    using DelayedTaskMap = std::map<Timestamp, std::vector<std::unique_ptr<QueuedTask>>>;
    DelayedTaskMap delayed_tasks_;

    Timestamp next_run_time_ = Timestamp::PlusInfinity();
};

} // namespace pairrtc

#endif
