#ifndef _SESSION_ROLE_AUTHORITY_H_
#define _SESSION_ROLE_AUTHORITY_H_

#include "base/defines.hpp"
#include "signaling/role.hpp"
#include "signaling/signaling_message.hpp"

#include <functional>

namespace pairrtc {

// RoleAuthority owns the role of the local participant.
class RoleAuthority {
public:
    using RoleChangedCallback = std::function<void(Role old_role, Role new_role)>;
public:
    explicit RoleAuthority(RoleChangedCallback callback);
    ~RoleAuthority();

    Role role() const { return role_; }

    // No-op and returns false if the role is not idle.
    bool StartAsInitiator();
    bool JoinAsResponder();
    // Forces the role back to idle, the callback is invoked even if 
    // the role is idle already, so the teardown always happens.
    void EndSession();

    // Offer is processable by the responder only, answer by the initiator 
    // only, and candidate by any non-idle role.
    bool IsProcessable(signaling::Message::Kind kind) const;
    static bool IsProcessable(Role role, signaling::Message::Kind kind);

private:
    void ChangeRole(Role new_role);

private:
    RoleChangedCallback callback_;
    Role role_ = Role::IDLE;
};

} // namespace pairrtc

#endif
