#ifndef _SESSION_NEGOTIATION_STATE_MACHINE_H_
#define _SESSION_NEGOTIATION_STATE_MACHINE_H_

#include "base/defines.hpp"
#include "session/connection.hpp"
#include "session/session_configuration.hpp"
#include "session/session_error.hpp"
#include "signaling/signaling_bus.hpp"
#include "rtc/base/task_utils/task_queue.hpp"
#include "rtc/base/task_utils/pending_task_safety_flag.hpp"
#include "rtc/media/media_devices.hpp"
#include "rtc/media/media_surface.hpp"
#include "rtc/pc/peer_transport.hpp"

#include <memory>
#include <iostream>

namespace pairrtc {

// NegotiationStateMachine drives the offer/answer exchange and the candidate
// accumulation of one Connection per role epoch. It MUST be used on `task_queue`.
class NegotiationStateMachine {
public:
    enum class State {
        IDLE = 0,
        AWAITING_ANSWER,
        AWAITING_OFFER,
        NEGOTIATING,
        CONNECTED,
        CLOSED
    };

    struct Dependencies {
        signaling::SignalingBus* signaling_bus = nullptr;
        PeerTransportFactory* transport_factory = nullptr;
        MediaDevices* media_devices = nullptr;
        MediaSurface* media_surface = nullptr;
    };

    class Observer {
    public:
        virtual ~Observer() = default;
        virtual void OnNegotiationStateChanged(State state) = 0;
        // The initiator published its offer.
        virtual void OnLocalOfferPublished() = 0;
        virtual void OnTransportStateChanged(PeerTransport::State state) = 0;
        virtual void OnRemoteStreamArrived() = 0;
        virtual void OnSessionError(const SessionError& error) = 0;
    };
public:
    NegotiationStateMachine(const SessionConfiguration& config,
                            Dependencies dependencies,
                            TaskQueue* task_queue,
                            Observer* observer);
    ~NegotiationStateMachine();

    State state() const { return state_; }
    Role role() const { return role_; }
    uint64_t epoch() const { return epoch_; }
    bool subscribed() const { return subscription_.active(); }
    // Returns nullptr if no connection exists.
    const Connection* connection() const { return connection_.get(); }

    // Invoked on every role change, starts a new epoch.
    void OnRoleChanged(Role new_role);

private:
    void StartAsInitiator(uint64_t epoch);
    void StartAsResponder(uint64_t epoch);

    void OnLocalMediaAcquired(uint64_t epoch, std::shared_ptr<MediaStream> stream);
    void OnLocalMediaFailed(uint64_t epoch, std::exception_ptr exp);
    void OnLocalDescriptionCreated(uint64_t epoch, sdp::Description local_sdp);
    void OnRemoteDescriptionApplied(uint64_t epoch);
    void OnRemoteDescriptionRejected(uint64_t epoch, std::exception_ptr exp);
    void OnNegotiationStepFailed(uint64_t epoch, std::exception_ptr exp);
    void OnConnectTimeout(uint64_t epoch, int attempt);

    void OnMessage(uint64_t epoch, const signaling::Message& message);
    void HandleRemoteDescription(const signaling::Message& message);
    void HandleRemoteCandidate(const signaling::Message& message);

    void OnConnectionEvent(uint64_t epoch, Connection::Event event);
    void HandleLocalCandidate(sdp::Candidate candidate);
    void HandleTransportState(PeerTransport::State state);
    void HandleRemoteStream(std::shared_ptr<MediaStream> stream);

    void CreateConnection(uint64_t epoch);
    void Subscribe(uint64_t epoch);
    void ScheduleConnectTimeout(uint64_t epoch);
    void CloseOnFailure(const std::string& reason);
    void Teardown();
    void SetState(State state);
    bool IsStale(uint64_t epoch) const;

private:
    DISALLOW_COPY_AND_ASSIGN(NegotiationStateMachine);
    const SessionConfiguration config_;
    const Dependencies dependencies_;
    TaskQueue* const task_queue_;
    Observer* const observer_;

    State state_ = State::IDLE;
    Role role_ = Role::IDLE;
    uint64_t epoch_ = 0;
    // At most one description step is in flight per connection.
    bool step_in_flight_ = false;
    int negotiation_attempt_ = 0;

    std::unique_ptr<Connection> connection_ = nullptr;
    signaling::ScopedSubscription subscription_;

    ScopedTaskSafety task_safety_;
};

std::ostream& operator<<(std::ostream& out, NegotiationStateMachine::State state);

} // namespace pairrtc

#endif
