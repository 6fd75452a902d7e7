#ifndef _COMMON_UTILS_STRING_H_
#define _COMMON_UTILS_STRING_H_

#include "base/defines.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pairrtc {
namespace utils {
namespace string {

bool match_prefix(std::string_view str, std::string_view prefix);
void trim_begin(std::string& str);
void trim_end(std::string& str);
// Splits 'key:value' at the first colon.
std::pair<std::string_view, std::string_view> parse_pair(std::string_view attr);
// Splits lines separated by '\n' or "\r\n", the empty lines are skipped.
std::vector<std::string> split_lines(const std::string& text);

} // namespace string
} // namespace utils
} // namespace pairrtc

#endif
