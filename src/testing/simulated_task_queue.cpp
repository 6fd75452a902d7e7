#include "testing/simulated_task_queue.hpp"
#include "testing/simulated_time_controller.hpp"

namespace pairrtc {
 
SimulatedTaskQueue::SimulatedTaskQueue(SimulatedTimeController* time_controller) 
    : time_controller_(time_controller) {
    time_controller_->Register(this);
}

SimulatedTaskQueue::~SimulatedTaskQueue() {
    time_controller_->Deregister(this);
}

Timestamp SimulatedTaskQueue::GetNextRunTime() const {
    std::lock_guard lock(lock_);
    return next_run_time_;
}

void SimulatedTaskQueue::RunReady(Timestamp at_time) {
    std::unique_lock lock(lock_);
    for (auto it = delayed_tasks_.begin(); 
         it != delayed_tasks_.end() && it->first <= at_time;
         it = delayed_tasks_.erase(it)) {
        for (auto& task : it->second) {
            ready_tasks_.push_back(std::move(task));
        }
    }
    CurrentTaskQueueSetter set_current(this);
    while (!ready_tasks_.empty()) {
        auto ready = std::move(ready_tasks_.front());
        ready_tasks_.pop_front();
        // NOTE: The task might post to this queue again, which will
        // grab `lock_`, so make sure it is free before running.
        lock.unlock();
        ready->Run();
        ready.reset();
        lock.lock();
    }
    if (!delayed_tasks_.empty()) {
        next_run_time_ = delayed_tasks_.begin()->first;
    } else {
        next_run_time_ = Timestamp::PlusInfinity();
    }
}

void SimulatedTaskQueue::Post(std::unique_ptr<QueuedTask> task) {
    std::lock_guard lock(lock_);
    ready_tasks_.push_back(std::move(task));
    // Run the task ASAP.
    next_run_time_ = Timestamp::MinusInfinity();
}

void SimulatedTaskQueue::PostDelayed(TimeDelta delay, std::unique_ptr<QueuedTask> task) {
    std::lock_guard lock(lock_);
    Timestamp target_time = time_controller_->CurrentTime() + delay;
    delayed_tasks_[target_time].push_back(std::move(task));
    next_run_time_ = std::min(next_run_time_, target_time);
}

void SimulatedTaskQueue::Delete() {
    // Destroy the tasks outside of the lock since task destruction
    // can lead to re-entry in SimulatedTaskQueue via custom destructors.
    ReadyTaskDeque ready_tasks;
    DelayedTaskMap delayed_tasks;
    {
        std::lock_guard lock(lock_);
        ready_tasks_.swap(ready_tasks);
        delayed_tasks_.swap(delayed_tasks);
    }
    ready_tasks.clear();
    delayed_tasks.clear();
    delete this;
}

} // namespace pairrtc
