#ifndef _RTC_BASE_TASK_UTILS_TASK_QUEUE_H_
#define _RTC_BASE_TASK_UTILS_TASK_QUEUE_H_

#include "base/defines.hpp"
#include "rtc/base/task_utils/task_queue_impl.hpp"

#include <memory>
#include <string>
#include <type_traits>

namespace pairrtc {

class PAIRRTC_EXPORT TaskQueue {
public:
    enum class Kind {
        BOOST
    };
public:
    explicit TaskQueue(std::string name, Kind kind = Kind::BOOST);
    explicit TaskQueue(std::unique_ptr<TaskQueueImpl, TaskQueueImpl::Deleter> task_queue_impl);
    ~TaskQueue();

    void Post(std::unique_ptr<QueuedTask> task);
    void PostDelayed(TimeDelta delay, std::unique_ptr<QueuedTask> task);

    template<typename Closure,
             typename std::enable_if<!std::is_convertible<
                Closure,
                std::unique_ptr<QueuedTask>>::value>::type* = nullptr>
    void Post(Closure&& closure) {
        Post(ToQueuedTask(std::forward<Closure>(closure)));
    }
    template<typename Closure,
             typename std::enable_if<!std::is_convertible<
                Closure,
                std::unique_ptr<QueuedTask>>::value>::type* = nullptr>
    void PostDelayed(TimeDelta delay, Closure&& closure) {
        PostDelayed(delay, ToQueuedTask(std::forward<Closure>(closure)));
    }

    bool IsCurrent() const;

    // Returns non-owning pointer to the task queue implementation.
    TaskQueueImpl* Get() { return impl_; }

private:
    DISALLOW_COPY_AND_ASSIGN(TaskQueue);
    TaskQueueImpl* const impl_;
};

} // namespace pairrtc

#endif
