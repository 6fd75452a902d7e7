#ifndef _RTC_BASE_UNITS_TIMESTAMP_H_
#define _RTC_BASE_UNITS_TIMESTAMP_H_

#include "base/defines.hpp"
#include "rtc/base/units/time_delta.hpp"

#include <limits>
#include <string>

namespace pairrtc {

// Timestamp represents the time that has passed since some unspecified epoch,
// stored in microseconds. The difference of two Timestamps results in a TimeDelta.
class PAIRRTC_EXPORT Timestamp {
public:
    template <typename T>
    static constexpr Timestamp Seconds(T value) {
        return Timestamp(TimeDelta::Seconds(value).us());
    }
    template <typename T>
    static constexpr Timestamp Millis(T value) {
        return Timestamp(TimeDelta::Millis(value).us());
    }
    template <typename T>
    static constexpr Timestamp Micros(T value) {
        return Timestamp(TimeDelta::Micros(value).us());
    }
    static constexpr Timestamp PlusInfinity() { 
        return Timestamp(std::numeric_limits<int64_t>::max()); 
    }
    static constexpr Timestamp MinusInfinity() { 
        return Timestamp(std::numeric_limits<int64_t>::min()); 
    }

    Timestamp() = delete;

    constexpr int64_t seconds() const { return us_ / 1'000'000; }
    constexpr int64_t ms() const { return us_ / 1'000; }
    constexpr int64_t us() const { return us_; }

    constexpr bool IsFinite() const { 
        return us_ != std::numeric_limits<int64_t>::max() && 
               us_ != std::numeric_limits<int64_t>::min(); 
    }

    constexpr Timestamp operator+(TimeDelta delta) const { 
        return delta.IsPlusInfinity() ? PlusInfinity() : Timestamp(us_ + delta.us()); 
    }
    constexpr TimeDelta operator-(Timestamp other) const { return TimeDelta::Micros(us_ - other.us_); }

    constexpr bool operator==(Timestamp other) const { return us_ == other.us_; }
    constexpr bool operator!=(Timestamp other) const { return us_ != other.us_; }
    constexpr bool operator<(Timestamp other) const { return us_ < other.us_; }
    constexpr bool operator<=(Timestamp other) const { return us_ <= other.us_; }
    constexpr bool operator>(Timestamp other) const { return us_ > other.us_; }
    constexpr bool operator>=(Timestamp other) const { return us_ >= other.us_; }

private:
    explicit constexpr Timestamp(int64_t us) : us_(us) {}

    int64_t us_;
};

} // namespace pairrtc

#endif
