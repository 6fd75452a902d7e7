#ifndef _SESSION_SESSION_STATUS_H_
#define _SESSION_SESSION_STATUS_H_

#include "base/defines.hpp"
#include "signaling/role.hpp"

#include <iostream>

namespace pairrtc {

// The link status collapses to `live` for the presentation layer.
enum class LinkStatus {
    STANDBY = 0,
    // The initiator finished its local setup, but nothing is confirmed.
    OPTIMISTICALLY_LIVE,
    // Remote media arrived or the transport reported connected.
    CONFIRMED_CONNECTED
};

struct PAIRRTC_EXPORT SessionStatus {
    Role role = Role::IDLE;
    bool live = false;
    bool failed = false;
    LinkStatus link_status = LinkStatus::STANDBY;

    bool operator==(const SessionStatus& other) const {
        return role == other.role && 
               live == other.live && 
               failed == other.failed && 
               link_status == other.link_status;
    }
    bool operator!=(const SessionStatus& other) const {
        return !(*this == other);
    }
};

PAIRRTC_EXPORT std::ostream& operator<<(std::ostream& out, LinkStatus link_status);
PAIRRTC_EXPORT std::ostream& operator<<(std::ostream& out, const SessionStatus& status);

} // namespace pairrtc

#endif
