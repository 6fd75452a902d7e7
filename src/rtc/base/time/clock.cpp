#include "rtc/base/time/clock.hpp"

#include <chrono>

namespace pairrtc {
namespace {

class RealTimeClock final : public Clock {
public:
    Timestamp CurrentTime() override {
        auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return Timestamp::Micros(std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count());
    }
};

} // namespace

std::unique_ptr<Clock> Clock::GetRealTimeClock() {
    return std::make_unique<RealTimeClock>();
}

} // namespace pairrtc
