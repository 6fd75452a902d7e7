#include "session/role_authority.hpp"

#include <plog/Log.h>

namespace pairrtc {

RoleAuthority::RoleAuthority(RoleChangedCallback callback) 
    : callback_(std::move(callback)) {}

RoleAuthority::~RoleAuthority() = default;

bool RoleAuthority::StartAsInitiator() {
    if (role_ != Role::IDLE) {
        PLOG_WARNING << "Ignored starting as initiator in role: " << role_;
        return false;
    }
    ChangeRole(Role::INITIATOR);
    return true;
}

bool RoleAuthority::JoinAsResponder() {
    if (role_ != Role::IDLE) {
        PLOG_WARNING << "Ignored joining as responder in role: " << role_;
        return false;
    }
    ChangeRole(Role::RESPONDER);
    return true;
}

void RoleAuthority::EndSession() {
    ChangeRole(Role::IDLE);
}

bool RoleAuthority::IsProcessable(signaling::Message::Kind kind) const {
    return IsProcessable(role_, kind);
}

bool RoleAuthority::IsProcessable(Role role, signaling::Message::Kind kind) {
    switch (kind) {
    case signaling::Message::Kind::OFFER:
        return role == Role::RESPONDER;
    case signaling::Message::Kind::ANSWER:
        return role == Role::INITIATOR;
    case signaling::Message::Kind::CANDIDATE:
        return role != Role::IDLE;
    default:
        RTC_NOTREACHED();
        return false;
    }
}

void RoleAuthority::ChangeRole(Role new_role) {
    Role old_role = role_;
    role_ = new_role;
    PLOG_INFO << "Role changed: " << old_role << " -> " << new_role;
    if (callback_) {
        callback_(old_role, new_role);
    }
}

} // namespace pairrtc
