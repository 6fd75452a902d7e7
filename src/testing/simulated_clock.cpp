#include "testing/simulated_clock.hpp"

namespace pairrtc {

SimulatedClock::SimulatedClock(Timestamp initial_time)
    : time_us_(initial_time.us()) {}

SimulatedClock::~SimulatedClock() = default;

Timestamp SimulatedClock::CurrentTime() {
    return Timestamp::Micros(time_us_.load(std::memory_order_relaxed));
}

void SimulatedClock::AdvanceTime(TimeDelta delta) {
    time_us_.fetch_add(delta.us(), std::memory_order_relaxed);
}

} // namespace pairrtc
