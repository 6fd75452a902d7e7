#ifndef _RTC_BASE_TIME_CLOCK_H_
#define _RTC_BASE_TIME_CLOCK_H_

#include "base/defines.hpp"
#include "rtc/base/units/timestamp.hpp"

#include <memory>

namespace pairrtc {

// A clock interface that allows reading of absolute timestamps.
class PAIRRTC_EXPORT Clock {
public:
    virtual ~Clock() = default;

    // Return a timestamp relative to the unix epoch.
    virtual Timestamp CurrentTime() = 0;

    int64_t now_ms() { return CurrentTime().ms(); }
    int64_t now_us() { return CurrentTime().us(); }

    // Returns an instance of the real-time system clock implementation.
    static std::unique_ptr<Clock> GetRealTimeClock();
};
    
} // namespace pairrtc

#endif
