#include "signaling/role.hpp"

#include <stdexcept>

namespace pairrtc {

std::string ToString(Role role) {
    switch (role) {
    case Role::INITIATOR:
        return "Initiator";
    case Role::RESPONDER:
        return "Responder";
    default:
        return "Idle";
    }
}

Role ToRole(const std::string& role_string) {
    if (role_string == "Idle") {
        return Role::IDLE;
    } else if (role_string == "Initiator") {
        return Role::INITIATOR;
    } else if (role_string == "Responder") {
        return Role::RESPONDER;
    }
    throw std::invalid_argument("Unknown role: " + role_string);
}

std::ostream& operator<<(std::ostream& out, Role role) {
    return out << ToString(role);
}

} // namespace pairrtc
