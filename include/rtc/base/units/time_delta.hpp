#ifndef _RTC_BASE_UNITS_TIME_DELTA_H_
#define _RTC_BASE_UNITS_TIME_DELTA_H_

#include "base/defines.hpp"

#include <limits>
#include <string>
#include <type_traits>

namespace pairrtc {

// TimeDelta represents the difference between two timestamps, stored
// in microseconds.
class PAIRRTC_EXPORT TimeDelta {
public:
    template <typename T>
    static constexpr TimeDelta Seconds(T value) {
        static_assert(std::is_arithmetic<T>::value, "");
        return TimeDelta(static_cast<int64_t>(value * 1'000'000));
    }
    template <typename T>
    static constexpr TimeDelta Millis(T value) {
        static_assert(std::is_arithmetic<T>::value, "");
        return TimeDelta(static_cast<int64_t>(value * 1'000));
    }
    template <typename T>
    static constexpr TimeDelta Micros(T value) {
        static_assert(std::is_arithmetic<T>::value, "");
        return TimeDelta(static_cast<int64_t>(value));
    }
    static constexpr TimeDelta Zero() { return TimeDelta(0); }
    static constexpr TimeDelta PlusInfinity() { 
        return TimeDelta(std::numeric_limits<int64_t>::max()); 
    }

    TimeDelta() = delete;

    constexpr int64_t seconds() const { return us_ / 1'000'000; }
    constexpr int64_t ms() const { return us_ / 1'000; }
    constexpr int64_t us() const { return us_; }

    constexpr bool IsZero() const { return us_ == 0; }
    constexpr bool IsPlusInfinity() const { return us_ == std::numeric_limits<int64_t>::max(); }

    constexpr TimeDelta operator+(TimeDelta other) const { return TimeDelta(us_ + other.us_); }
    constexpr TimeDelta operator-(TimeDelta other) const { return TimeDelta(us_ - other.us_); }
    constexpr TimeDelta operator*(int64_t scalar) const { return TimeDelta(us_ * scalar); }
    TimeDelta& operator+=(TimeDelta other) { us_ += other.us_; return *this; }

    constexpr bool operator==(TimeDelta other) const { return us_ == other.us_; }
    constexpr bool operator!=(TimeDelta other) const { return us_ != other.us_; }
    constexpr bool operator<(TimeDelta other) const { return us_ < other.us_; }
    constexpr bool operator<=(TimeDelta other) const { return us_ <= other.us_; }
    constexpr bool operator>(TimeDelta other) const { return us_ > other.us_; }
    constexpr bool operator>=(TimeDelta other) const { return us_ >= other.us_; }

private:
    explicit constexpr TimeDelta(int64_t us) : us_(us) {}

    int64_t us_;
};

} // namespace pairrtc

#endif
