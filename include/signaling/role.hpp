#ifndef _SIGNALING_ROLE_H_
#define _SIGNALING_ROLE_H_

#include "base/defines.hpp"

#include <string>
#include <iostream>

namespace pairrtc {

// The mutually exclusive roles a participant can hold in a session.
enum class Role {
    IDLE = 0,
    INITIATOR,
    RESPONDER
};

PAIRRTC_EXPORT std::string ToString(Role role);
// Throws std::invalid_argument if the string names no role.
PAIRRTC_EXPORT Role ToRole(const std::string& role_string);

PAIRRTC_EXPORT std::ostream& operator<<(std::ostream& out, Role role);

} // namespace pairrtc

#endif
