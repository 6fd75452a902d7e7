#ifndef _SESSION_CONNECTION_LIFECYCLE_TRACKER_H_
#define _SESSION_CONNECTION_LIFECYCLE_TRACKER_H_

#include "base/defines.hpp"
#include "session/session_status.hpp"
#include "rtc/pc/peer_transport.hpp"

#include <functional>

namespace pairrtc {

// ConnectionLifecycleTracker derives the presentation status from the
// transport connectivity, and publishes it only on change.
class ConnectionLifecycleTracker {
public:
    using StatusCallback = std::function<void(const SessionStatus& status)>;
public:
    explicit ConnectionLifecycleTracker(StatusCallback callback);
    ~ConnectionLifecycleTracker();

    const SessionStatus& status() const { return status_; }

    void OnRoleChanged(Role role);
    void OnLocalOfferPublished();
    void OnRemoteStreamArrived();
    void OnTransportStateChanged(PeerTransport::State state);
    // The negotiation closed without a transport report, e.g. connect timeout.
    void OnNegotiationClosed();

private:
    void Update(LinkStatus link_status, bool failed);
    void Publish(SessionStatus status);

private:
    DISALLOW_COPY_AND_ASSIGN(ConnectionLifecycleTracker);
    StatusCallback callback_;
    SessionStatus status_;
};

} // namespace pairrtc

#endif
