#include "testing/simulated_time_controller.hpp"
#include "testing/simulated_task_queue.hpp"

#include <algorithm>
#include <cassert>

namespace pairrtc {
namespace {
// Helper function to remove from a std container by value
template <class C>
bool RemoveByValue(C* container, typename C::value_type val) {
    auto it = std::find(container->begin(), container->end(), val);
    if (it == container->end()) {
        return false;
    }
    container->erase(it);
    return true;
}
    
} // namespace

SimulatedTimeController::SimulatedTimeController(Timestamp start_time) 
    : current_time_(start_time),
      sim_clock_(std::make_unique<SimulatedClock>(start_time)) {}

SimulatedTimeController::~SimulatedTimeController() = default;

std::unique_ptr<TaskQueue> SimulatedTimeController::CreateTaskQueue() {
    return std::make_unique<TaskQueue>(std::unique_ptr<TaskQueueImpl, TaskQueueImpl::Deleter>(new SimulatedTaskQueue(this)));
}

Clock* SimulatedTimeController::GetClock() const {
    return sim_clock_.get();
}

Timestamp SimulatedTimeController::CurrentTime() const {
    std::lock_guard lock(time_lock_);
    return current_time_;
}

Timestamp SimulatedTimeController::NextRunTime() const {
    Timestamp curr_time = CurrentTime();
    Timestamp next_time = Timestamp::PlusInfinity();
    std::lock_guard lock(lock_);
    for (auto* runner : runners_) {
        Timestamp next_run_time = runner->GetNextRunTime();
        if (next_run_time <= curr_time) {
            return curr_time;
        }
        next_time = std::min(next_time, next_run_time);
    }
    return next_time;
}

void SimulatedTimeController::RunPending() {
    RunReadyRunners();
}

void SimulatedTimeController::AdvanceTime(TimeDelta duration) {
    Timestamp curr_time = CurrentTime();
    Timestamp target_time = curr_time + duration;
    while (curr_time < target_time) {
        RunReadyRunners();
        Timestamp next_time = std::min(NextRunTime(), target_time);
        AdvanceTimeTo(next_time);
        sim_clock_->AdvanceTime(next_time - curr_time);
        curr_time = next_time;
    }
    // After time has been simulated up until `target_time` we also need to run
    // tasks meant to be executed at `target_time`.
    RunReadyRunners();
}

void SimulatedTimeController::Register(SimulatedSequenceRunner* runner) {
    std::lock_guard lock(lock_);
    runners_.push_back(runner);
}

void SimulatedTimeController::Deregister(SimulatedSequenceRunner* runner) {
    std::lock_guard lock(lock_);
    if (RemoveByValue(&runners_, runner)) {
        RemoveByValue(&ready_runners_, runner);
    }
}

// Private methods
void SimulatedTimeController::AdvanceTimeTo(Timestamp target_time) {
    std::lock_guard lock(time_lock_);
    assert(target_time >= current_time_);
    current_time_ = target_time;
}

void SimulatedTimeController::RunReadyRunners() {
    std::lock_guard lock(lock_);
    Timestamp curr_time = CurrentTime();
    ready_runners_.clear();

    while (true) {
        for (auto* runner : runners_) {
            if (runner->GetNextRunTime() <= curr_time) {
                ready_runners_.push_back(runner);
            }
        }
        if (ready_runners_.empty()) {
            break;
        }
        while (!ready_runners_.empty()) {
            auto* runner = ready_runners_.front();
            ready_runners_.pop_front();
            runner->RunReady(curr_time);
        }
    }
}
    
} // namespace pairrtc
