#ifndef _TESTING_SIMULATED_TIME_CONTROLLER_H_
#define _TESTING_SIMULATED_TIME_CONTROLLER_H_

#include "base/defines.hpp"
#include "rtc/base/task_utils/task_queue.hpp"
#include "testing/simulated_clock.hpp"
#include "testing/simulated_sequence_runner.hpp"

#include <list>
#include <memory>
#include <mutex>
#include <vector>

namespace pairrtc {

// SimulatedTimeController drives all the task queues created by it
// on the calling thread, so tests run deterministically.
class SimulatedTimeController {
public:
    explicit SimulatedTimeController(Timestamp start_time);
    ~SimulatedTimeController();

    std::unique_ptr<TaskQueue> CreateTaskQueue();
    Clock* GetClock() const;

    Timestamp CurrentTime() const;
    Timestamp NextRunTime() const;

    // Runs every task ready at the current time, including the
    // tasks posted by them.
    void RunPending();
    void AdvanceTime(TimeDelta duration);

    void Register(SimulatedSequenceRunner* runner);
    void Deregister(SimulatedSequenceRunner* runner);

private:
    void AdvanceTimeTo(Timestamp target_time);
    void RunReadyRunners();

private:
    mutable std::mutex time_lock_;
    mutable std::recursive_mutex lock_;

    Timestamp current_time_;
    std::unique_ptr<SimulatedClock> sim_clock_;

    std::vector<SimulatedSequenceRunner*> runners_;
    std::list<SimulatedSequenceRunner*> ready_runners_;
};
    
} // namespace pairrtc

#endif
