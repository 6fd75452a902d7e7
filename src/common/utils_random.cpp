#include "common/utils_random.hpp"

#include <cstdio>

namespace pairrtc {
namespace utils {
namespace random {

std::string random_string(size_t length) {
    static const std::string possible_characters("0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz");
    std::string ret;
    ret.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        ret += possible_characters[random<size_t>(0, possible_characters.size() - 1)];
    }
    return ret;
}

std::string random_hex_bytes(size_t count) {
    std::string ret;
    char buf[4];
    for (size_t i = 0; i < count; ++i) {
        std::snprintf(buf, sizeof(buf), "%02X", random<int>(0, 255));
        if (i > 0) {
            ret += ':';
        }
        ret += buf;
    }
    return ret;
}

} // namespace random
} // namespace utils
} // namespace pairrtc
