#ifndef _RTC_SDP_DEFINES_H_
#define _RTC_SDP_DEFINES_H_

#include "base/defines.hpp"

#include <string>
#include <iostream>

namespace pairrtc {
namespace sdp {

enum class Type {
    UNSPEC,
    OFFER,
    ANSWER,
    PRANSWER, // provisional answer
    ROLLBACK
};

enum class Direction {
    INACTIVE,
    SEND_ONLY,
    RECV_ONLY,
    SEND_RECV
};

PAIRRTC_EXPORT std::string ToString(Type type);
// Returns Type::UNSPEC if the string is unknown.
PAIRRTC_EXPORT Type ToType(const std::string& type_string);

PAIRRTC_EXPORT std::string ToString(Direction direction);
PAIRRTC_EXPORT Direction ToDirection(const std::string& direction_string);

// Overload operator <<
PAIRRTC_EXPORT std::ostream& operator<<(std::ostream& out, Type type);
PAIRRTC_EXPORT std::ostream& operator<<(std::ostream& out, Direction direction);

} // namespace sdp
} // namespace pairrtc

#endif
