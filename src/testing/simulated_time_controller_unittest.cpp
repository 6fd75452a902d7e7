#include "testing/simulated_time_controller.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

#include <vector>

namespace pairrtc {
namespace test {
namespace {

constexpr Timestamp kStartTime = Timestamp::Seconds(1000);
    
} // namespace

MY_TEST(SimulatedTimeControllerTest, DelayedTaskRunOnTime) {
    SimulatedTimeController time_simulation(kStartTime);
    auto task_queue = time_simulation.CreateTaskQueue();

    bool delay_task_executed = false;
    task_queue->PostDelayed(TimeDelta::Millis(10), [&](){
        delay_task_executed = true;
    });

    time_simulation.AdvanceTime(TimeDelta::Millis(0));
    EXPECT_FALSE(delay_task_executed);

    time_simulation.AdvanceTime(TimeDelta::Millis(10));
    EXPECT_TRUE(delay_task_executed);
    EXPECT_EQ(time_simulation.GetClock()->CurrentTime(), kStartTime + TimeDelta::Millis(10));
}

MY_TEST(SimulatedTimeControllerTest, TasksPostedByTaskRunInOrder) {
    SimulatedTimeController time_simulation(kStartTime);
    auto task_queue = time_simulation.CreateTaskQueue();

    std::vector<int> order;
    task_queue->Post([&](){
        order.push_back(1);
        EXPECT_TRUE(task_queue->IsCurrent());
        task_queue->Post([&](){
            order.push_back(3);
        });
    });
    task_queue->Post([&](){
        order.push_back(2);
    });

    EXPECT_TRUE(order.empty());
    time_simulation.RunPending();
    EXPECT_EQ(order, std::vector<int>({1, 2, 3}));
}

MY_TEST(SimulatedTimeControllerTest, PendingTasksDroppedWithQueue) {
    SimulatedTimeController time_simulation(kStartTime);
    auto task_queue = time_simulation.CreateTaskQueue();

    bool executed = false;
    task_queue->PostDelayed(TimeDelta::Millis(5), [&](){
        executed = true;
    });
    task_queue.reset();

    time_simulation.AdvanceTime(TimeDelta::Millis(10));
    EXPECT_FALSE(executed);
}

} // namespace test
} // namespace pairrtc
