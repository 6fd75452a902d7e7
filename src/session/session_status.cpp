#include "session/session_status.hpp"
#include "session/session_error.hpp"

namespace pairrtc {

std::ostream& operator<<(std::ostream& out, LinkStatus link_status) {
    switch (link_status) {
    case LinkStatus::OPTIMISTICALLY_LIVE:
        return out << "optimistically_live";
    case LinkStatus::CONFIRMED_CONNECTED:
        return out << "confirmed_connected";
    default:
        return out << "standby";
    }
}

std::ostream& operator<<(std::ostream& out, const SessionStatus& status) {
    return out << "{role: " << status.role
               << ", live: " << std::boolalpha << status.live
               << ", failed: " << status.failed << std::noboolalpha
               << ", link: " << status.link_status << "}";
}

std::ostream& operator<<(std::ostream& out, SessionError::Kind kind) {
    switch (kind) {
    case SessionError::Kind::LOCAL_MEDIA_DENIED:
        return out << "local_media_denied";
    case SessionError::Kind::SIGNALING:
        return out << "signaling";
    case SessionError::Kind::TRANSPORT:
        return out << "transport";
    default:
        return out << "analysis";
    }
}

std::ostream& operator<<(std::ostream& out, const SessionError& error) {
    return out << error.kind << ": " << error.message;
}

} // namespace pairrtc
