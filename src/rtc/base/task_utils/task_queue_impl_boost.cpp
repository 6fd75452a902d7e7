#include "rtc/base/task_utils/task_queue_impl_boost.hpp"

#include <plog/Log.h>

namespace pairrtc {

// ScopedQueuedTask
// boost::asio requires a copyable handler, so the unique task is 
// shared between the copies and runs at most once.
class TaskQueueImplBoost::ScopedQueuedTask {
public: 
    explicit ScopedQueuedTask(std::unique_ptr<QueuedTask> queued_task) 
        : queued_task_(std::move(queued_task)) {}

    void operator()() {
        if (queued_task_) {
            queued_task_->Run();
            queued_task_.reset();
        }
    }   

private:
    std::shared_ptr<QueuedTask> queued_task_;
};

std::unique_ptr<TaskQueueImpl, TaskQueueImpl::Deleter> TaskQueueImplBoost::Create(std::string name) {
    return std::unique_ptr<TaskQueueImpl, TaskQueueImpl::Deleter>(new TaskQueueImplBoost(std::move(name)));
}

TaskQueueImplBoost::TaskQueueImplBoost(std::string name) 
    : name_(std::move(name)),
      work_guard_(boost::asio::make_work_guard(ioc_)),
      strand_(ioc_) {
    // The thread will start immediately after created
    ioc_thread_.reset(new boost::thread([this](){
        // Set the current task queue of the thread.
        CurrentTaskQueueSetter set_current(this);
        PLOG_VERBOSE << "Task queue [" << name_ << "] started.";
        // Run and block the thread.
        ioc_.run();
        PLOG_VERBOSE << "Task queue [" << name_ << "] exited.";
    }));
}

TaskQueueImplBoost::~TaskQueueImplBoost() = default;

void TaskQueueImplBoost::Delete() {
    assert(IsCurrent() == false);
    // Pending timers keep the io_context busy, cancel them 
    // to let the thread exit without waiting for their deadlines.
    boost::asio::post(strand_, [this](){
        CancelPendingTimers();
    });
    // Indicate that the work is no longer working, ioc will exit later.
    work_guard_.reset();
    if (ioc_thread_->joinable()) {
        // Blocks until all queued tasks have been executed.
        PLOG_VERBOSE << "Blocking thread and waiting all task done.";
        ioc_thread_->join();
    }
    ioc_thread_.reset();
    // Delete itself after the associated thread exited.
    delete this;
}

void TaskQueueImplBoost::Post(std::unique_ptr<QueuedTask> task) {
    boost::asio::post(strand_, ScopedQueuedTask(std::move(task)));
}

void TaskQueueImplBoost::PostDelayed(TimeDelta delay, std::unique_ptr<QueuedTask> task) {
    std::shared_ptr<QueuedTask> shared_task(std::move(task));
    if (delay.ms() <= 0) {
        boost::asio::post(strand_, [shared_task](){
            shared_task->Run();
        });
        return;
    }
    boost::asio::post(strand_, [this, delay, shared_task](){
        ScheduleTaskAfter(delay, shared_task);
    });
}

// Private methods
void TaskQueueImplBoost::ScheduleTaskAfter(TimeDelta delay, std::shared_ptr<QueuedTask> task) {
    assert(IsCurrent());
    auto timer = std::make_shared<boost::asio::deadline_timer>(ioc_, boost::posix_time::milliseconds(delay.ms()));
    pending_timers_.push_back(timer);
    // Start an asynchronous wait
    timer->async_wait(boost::asio::bind_executor(strand_, [this, timer, task](const boost::system::error_code& error) {
        pending_timers_.remove(timer);
        if (error == boost::asio::error::operation_aborted) {
            PLOG_VERBOSE << "Delayed task cancelled.";
            return;
        }
        task->Run();
    }));
}

void TaskQueueImplBoost::CancelPendingTimers() {
    for (auto& timer : pending_timers_) {
        boost::system::error_code ec;
        timer->cancel(ec);
    }
}
    
} // namespace pairrtc
