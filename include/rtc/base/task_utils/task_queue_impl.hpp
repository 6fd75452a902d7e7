#ifndef _RTC_BASE_TASK_UTILS_TASK_QUEUE_IMPL_H_
#define _RTC_BASE_TASK_UTILS_TASK_QUEUE_IMPL_H_

#include "base/defines.hpp"
#include "rtc/base/units/time_delta.hpp"
#include "rtc/base/task_utils/queued_task.hpp"

#include <memory>

namespace pairrtc {

class PAIRRTC_EXPORT TaskQueueImpl {
public:
    struct Deleter {
        void operator()(TaskQueueImpl* task_queue) const { task_queue->Delete(); }
    };
public:
    // Starts destruction of the task queue.
    // On return ensures no task are running and no new tasks are 
    // able to start on the task queue.
    virtual void Delete() = 0;

    // Schedules a task to execute. Tasks are executed in FIFO order.
    virtual void Post(std::unique_ptr<QueuedTask> task) = 0;
    // Schedules a task to execute a specified delay from when the call is made.
    virtual void PostDelayed(TimeDelta delay, std::unique_ptr<QueuedTask> task) = 0;

    // Returns the task queue that is running the current thread.
    // Returns nullptr if this thread is not associated with any task queue.
    static TaskQueueImpl* Current();

    // Returns true if this task queue is running the current thread.
    bool IsCurrent() const { return Current() == this; }

protected:
    class CurrentTaskQueueSetter {
    public:
        explicit CurrentTaskQueueSetter(TaskQueueImpl* task_queue);
        CurrentTaskQueueSetter(const CurrentTaskQueueSetter&) = delete;
        CurrentTaskQueueSetter& operator=(const CurrentTaskQueueSetter&) = delete;
        ~CurrentTaskQueueSetter();
    private:
        TaskQueueImpl* const previous_;
    };

    // Users of the TaskQueue should call Delete instead of 
    // directly deleting this instance.
    virtual ~TaskQueueImpl() = default;
};
    
} // namespace pairrtc

#endif
