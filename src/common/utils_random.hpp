#ifndef _COMMON_UTILS_RANDOM_H_
#define _COMMON_UTILS_RANDOM_H_

#include "base/defines.hpp"

#include <random>
#include <string>
#include <type_traits>

namespace pairrtc {
namespace utils {
namespace random {

template <
    typename T, 
    typename = typename std::enable_if<std::is_integral<T>::value, T>::type
>
T random(T lhs, T rhs) {
    static thread_local std::mt19937 engine(std::random_device{}());
    std::uniform_int_distribution<T> uniform(lhs, rhs);
    return uniform(engine);
};

std::string random_string(size_t length);
// Returns colon separated upper-case hex bytes, e.g. "3A:F0:..."
std::string random_hex_bytes(size_t count);

} // namespace random
} // namespace utils
} // namespace pairrtc

#endif
