#ifndef _BASE_DEFINES_H_
#define _BASE_DEFINES_H_

#include <cassert>
#include <cstdint>
#include <functional>
#include <vector>

#ifndef PAIRRTC_EXPORT
#define PAIRRTC_EXPORT
#endif

// DISALLOW_COPY_AND_ASSIGN
#define DISALLOW_COPY_AND_ASSIGN(TypeName)  \
    TypeName(const TypeName&) = delete;     \
    TypeName& operator=(const TypeName&) = delete

// RTC_NOTREACHED
#define RTC_NOTREACHED() \
    assert(false && "NOT REACHED")

namespace pairrtc {

// overloaded helper for std::visit
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace pairrtc

#endif
