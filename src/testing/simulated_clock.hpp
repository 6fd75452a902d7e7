#ifndef _TESTING_SIMULATED_CLOCK_H_
#define _TESTING_SIMULATED_CLOCK_H_

#include "rtc/base/time/clock.hpp"

#include <atomic>

namespace pairrtc {

class SimulatedClock : public Clock {
public:
    explicit SimulatedClock(Timestamp initial_time);
    ~SimulatedClock() override;

    Timestamp CurrentTime() override;

    void AdvanceTime(TimeDelta delta);

private:
    std::atomic<int64_t> time_us_;
};

} // namespace pairrtc

#endif
