#include "rtc/pc/peer_transport.hpp"

namespace pairrtc {

std::ostream& operator<<(std::ostream& out, PeerTransport::State state) {
    switch (state) {
    case PeerTransport::State::NEW:
        return out << "new";
    case PeerTransport::State::CONNECTING:
        return out << "connecting";
    case PeerTransport::State::CONNECTED:
        return out << "connected";
    case PeerTransport::State::DISCONNECTED:
        return out << "disconnected";
    case PeerTransport::State::FAILED:
        return out << "failed";
    case PeerTransport::State::CLOSED:
        return out << "closed";
    default:
        return out << "unknown";
    }
}

} // namespace pairrtc
