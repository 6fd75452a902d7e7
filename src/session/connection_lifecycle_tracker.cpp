#include "session/connection_lifecycle_tracker.hpp"

#include <plog/Log.h>

namespace pairrtc {

ConnectionLifecycleTracker::ConnectionLifecycleTracker(StatusCallback callback) 
    : callback_(std::move(callback)) {}

ConnectionLifecycleTracker::~ConnectionLifecycleTracker() = default;

void ConnectionLifecycleTracker::OnRoleChanged(Role role) {
    SessionStatus status;
    status.role = role;
    Publish(status);
}

void ConnectionLifecycleTracker::OnLocalOfferPublished() {
    // The initiator is regarded as live eagerly.
    if (status_.role == Role::INITIATOR && 
        status_.link_status == LinkStatus::STANDBY && 
        !status_.failed) {
        Update(LinkStatus::OPTIMISTICALLY_LIVE, false);
    }
}

void ConnectionLifecycleTracker::OnRemoteStreamArrived() {
    Update(LinkStatus::CONFIRMED_CONNECTED, false);
}

void ConnectionLifecycleTracker::OnTransportStateChanged(PeerTransport::State state) {
    switch (state) {
    case PeerTransport::State::CONNECTED:
        Update(LinkStatus::CONFIRMED_CONNECTED, false);
        break;
    case PeerTransport::State::DISCONNECTED:
    case PeerTransport::State::FAILED:
        Update(LinkStatus::STANDBY, true);
        break;
    default:
        break;
    }
}

void ConnectionLifecycleTracker::OnNegotiationClosed() {
    Update(LinkStatus::STANDBY, true);
}

// Private methods
void ConnectionLifecycleTracker::Update(LinkStatus link_status, bool failed) {
    if (status_.role == Role::IDLE) {
        PLOG_DEBUG << "Ignored link status " << link_status << " in idle.";
        return;
    }
    SessionStatus status = status_;
    status.link_status = link_status;
    status.failed = failed;
    status.live = link_status != LinkStatus::STANDBY;
    Publish(status);
}

void ConnectionLifecycleTracker::Publish(SessionStatus status) {
    if (status == status_) {
        return;
    }
    PLOG_INFO << "Session status changed: " << status;
    status_ = status;
    if (callback_) {
        callback_(status_);
    }
}

} // namespace pairrtc
