#ifndef _RTC_BASE_TASK_UTILS_TASK_QUEUE_IMPL_BOOST_H_
#define _RTC_BASE_TASK_UTILS_TASK_QUEUE_IMPL_BOOST_H_

#include "base/defines.hpp"
#include "rtc/base/task_utils/task_queue_impl.hpp"

#include <boost/asio.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/io_context_strand.hpp>
#include <boost/thread/thread.hpp>

#include <list>
#include <memory>
#include <string>

namespace pairrtc {

class TaskQueueImplBoost final : public TaskQueueImpl {
public:
    static std::unique_ptr<TaskQueueImpl, TaskQueueImpl::Deleter> Create(std::string name);
public:
    void Delete() override;
    void Post(std::unique_ptr<QueuedTask> task) override;
    void PostDelayed(TimeDelta delay, std::unique_ptr<QueuedTask> task) override;

private:
    // Users of the TaskQueue should call Create instead of 
    // directly create this instance.
    explicit TaskQueueImplBoost(std::string name);
    ~TaskQueueImplBoost() override;

    class ScopedQueuedTask;
    void ScheduleTaskAfter(TimeDelta delay, std::shared_ptr<QueuedTask> task);
    void CancelPendingTimers();

private:
    const std::string name_;
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    boost::asio::io_context::strand strand_;
    std::unique_ptr<boost::thread> ioc_thread_;

    // Accessed on `strand_` only.
    std::list<std::shared_ptr<boost::asio::deadline_timer>> pending_timers_;
};
    
} // namespace pairrtc

#endif
