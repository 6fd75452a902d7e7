#include "session/negotiation_state_machine.hpp"
#include "session/role_authority.hpp"

#include <plog/Log.h>

#include <optional>
#include <sstream>
#include <variant>

namespace pairrtc {
namespace {

std::string ExceptionToString(std::exception_ptr exp) {
    try {
        if (exp) {
            std::rethrow_exception(exp);
        }
    } catch (const std::exception& e) {
        return e.what();
    }
    return "unknown";
}
    
} // namespace

NegotiationStateMachine::NegotiationStateMachine(const SessionConfiguration& config,
                                                 Dependencies dependencies,
                                                 TaskQueue* task_queue,
                                                 Observer* observer) 
    : config_(config),
      dependencies_(dependencies),
      task_queue_(task_queue),
      observer_(observer) {
    if (!dependencies_.signaling_bus || 
        !dependencies_.transport_factory || 
        !dependencies_.media_devices || 
        !dependencies_.media_surface) {
        throw std::invalid_argument("Missing negotiation dependencies.");
    }
    if (!task_queue_ || !observer_) {
        throw std::invalid_argument("Negotiation requires a task queue and an observer.");
    }
}

NegotiationStateMachine::~NegotiationStateMachine() {
    Teardown();
}

void NegotiationStateMachine::OnRoleChanged(Role new_role) {
    RTC_RUN_ON(task_queue_);
    ++epoch_;
    Teardown();
    role_ = new_role;
    PLOG_DEBUG << "Negotiation epoch " << epoch_ << " started in role: " << role_;

    switch (new_role) {
    case Role::IDLE:
        SetState(State::IDLE);
        break;
    case Role::INITIATOR:
        Subscribe(epoch_);
        SetState(State::AWAITING_ANSWER);
        StartAsInitiator(epoch_);
        break;
    case Role::RESPONDER:
        Subscribe(epoch_);
        SetState(State::AWAITING_OFFER);
        StartAsResponder(epoch_);
        break;
    }
}

// Private methods
void NegotiationStateMachine::StartAsInitiator(uint64_t epoch) {
    step_in_flight_ = true;
    PLOG_INFO << "Acquiring local media.";
    dependencies_.media_devices->GetUserMedia(config_.media_constraints,
        [this, task_queue=task_queue_, flag=task_safety_.flag(), epoch](std::shared_ptr<MediaStream> stream){
            task_queue->Post([this, flag, epoch, stream=std::move(stream)](){
                if (!flag->alive()) {
                    stream->Stop();
                    return;
                }
                OnLocalMediaAcquired(epoch, stream);
            });
        },
        [this, task_queue=task_queue_, flag=task_safety_.flag(), epoch](std::exception_ptr exp){
            task_queue->Post(ToQueuedTask(flag, [this, epoch, exp](){
                OnLocalMediaFailed(epoch, exp);
            }));
        });
}

void NegotiationStateMachine::StartAsResponder(uint64_t epoch) {
    // The responder listens with a bare connection.
    CreateConnection(epoch);
}

void NegotiationStateMachine::OnLocalMediaAcquired(uint64_t epoch, std::shared_ptr<MediaStream> stream) {
    RTC_RUN_ON(task_queue_);
    if (IsStale(epoch) || state_ != State::AWAITING_ANSWER || connection_) {
        PLOG_INFO << "Local media acquired after the epoch " << epoch << " ended, stopping it.";
        stream->Stop();
        return;
    }
    CreateConnection(epoch);
    if (!connection_) {
        stream->Stop();
        return;
    }
    dependencies_.media_surface->AttachLocalStream(stream);
    connection_->AttachLocalMedia(std::move(stream));
    connection_->CreateLocalDescription([this, epoch](sdp::Description local_sdp){
        OnLocalDescriptionCreated(epoch, std::move(local_sdp));
    }, [this, epoch](std::exception_ptr exp){
        OnNegotiationStepFailed(epoch, exp);
    });
}

void NegotiationStateMachine::OnLocalMediaFailed(uint64_t epoch, std::exception_ptr exp) {
    RTC_RUN_ON(task_queue_);
    if (IsStale(epoch)) {
        return;
    }
    PLOG_WARNING << "Failed to acquire local media: " << ExceptionToString(exp);
    step_in_flight_ = false;
    observer_->OnSessionError({SessionError::Kind::LOCAL_MEDIA_DENIED, kLocalMediaDeniedMessage});
}

void NegotiationStateMachine::OnLocalDescriptionCreated(uint64_t epoch, sdp::Description local_sdp) {
    RTC_RUN_ON(task_queue_);
    if (IsStale(epoch)) {
        return;
    }
    step_in_flight_ = false;
    if (role_ == Role::INITIATOR) {
        dependencies_.signaling_bus->Publish(signaling::Message::Offer(local_sdp, role_));
        PLOG_INFO << "Published local offer.";
        observer_->OnLocalOfferPublished();
    } else {
        dependencies_.signaling_bus->Publish(signaling::Message::Answer(local_sdp, role_));
        PLOG_INFO << "Published local answer.";
    }
}

void NegotiationStateMachine::OnRemoteDescriptionApplied(uint64_t epoch) {
    RTC_RUN_ON(task_queue_);
    if (IsStale(epoch) || !connection_) {
        return;
    }
    if (role_ == Role::RESPONDER) {
        // The step stays in flight until the answer is published.
        connection_->CreateLocalDescription([this, epoch](sdp::Description local_sdp){
            OnLocalDescriptionCreated(epoch, std::move(local_sdp));
        }, [this, epoch](std::exception_ptr exp){
            OnNegotiationStepFailed(epoch, exp);
        });
    } else {
        step_in_flight_ = false;
    }
}

void NegotiationStateMachine::OnRemoteDescriptionRejected(uint64_t epoch, std::exception_ptr exp) {
    RTC_RUN_ON(task_queue_);
    if (IsStale(epoch)) {
        return;
    }
    PLOG_WARNING << "Remote description rejected: " << ExceptionToString(exp);
    step_in_flight_ = false;
    // Cancels the pending connect timeout.
    ++negotiation_attempt_;
    SetState(role_ == Role::INITIATOR ? State::AWAITING_ANSWER : State::AWAITING_OFFER);
    observer_->OnSessionError({SessionError::Kind::SIGNALING, kRemoteDescriptionRejectedMessage});
}

void NegotiationStateMachine::OnNegotiationStepFailed(uint64_t epoch, std::exception_ptr exp) {
    RTC_RUN_ON(task_queue_);
    if (IsStale(epoch)) {
        return;
    }
    CloseOnFailure("negotiation step failed: " + ExceptionToString(exp));
}

void NegotiationStateMachine::OnConnectTimeout(uint64_t epoch, int attempt) {
    RTC_RUN_ON(task_queue_);
    if (IsStale(epoch) || attempt != negotiation_attempt_ || state_ != State::NEGOTIATING) {
        return;
    }
    CloseOnFailure("not connected within " + std::to_string(config_.connect_timeout->ms()) + " ms");
}

void NegotiationStateMachine::OnMessage(uint64_t epoch, const signaling::Message& message) {
    RTC_RUN_ON(task_queue_);
    if (IsStale(epoch)) {
        PLOG_VERBOSE << "Dropped " << message.kind << " of the stale epoch " << epoch;
        return;
    }
    if (!RoleAuthority::IsProcessable(role_, message.kind)) {
        if (message.sender_role == role_) {
            PLOG_VERBOSE << "Dropped the echo of local " << message.kind;
        } else {
            PLOG_WARNING << "Ignored " << message.kind << " in role: " << role_;
        }
        return;
    }
    if (message.kind == signaling::Message::Kind::CANDIDATE) {
        HandleRemoteCandidate(message);
    } else {
        HandleRemoteDescription(message);
    }
}

void NegotiationStateMachine::HandleRemoteDescription(const signaling::Message& message) {
    if (!connection_) {
        PLOG_WARNING << "Ignored " << message.kind << " without connection.";
        return;
    }
    const State expected_state = role_ == Role::INITIATOR ? State::AWAITING_ANSWER : State::AWAITING_OFFER;
    if (state_ != expected_state || step_in_flight_) {
        PLOG_WARNING << "Ignored " << message.kind << " in state: " << state_ 
                     << (step_in_flight_ ? " with a step in flight." : ".");
        return;
    }

    std::optional<sdp::Description> remote_sdp;
    try {
        remote_sdp.emplace(signaling::PayloadToDescription(message.payload));
    } catch (const std::invalid_argument& exp) {
        PLOG_WARNING << "Ignored malformed " << message.kind << ": " << exp.what();
        return;
    }

    if (connection_->IsLocalEcho(*remote_sdp)) {
        PLOG_VERBOSE << "Dropped the echo of local description.";
        return;
    }
    if (remote_sdp->type() != connection_->expected_remote_type()) {
        PLOG_WARNING << "Ignored " << message.kind << " carrying a remote " << remote_sdp->type() 
                     << " in role: " << role_;
        return;
    }

    step_in_flight_ = true;
    SetState(State::NEGOTIATING);
    ScheduleConnectTimeout(epoch_);

    const uint64_t epoch = epoch_;
    connection_->ApplyRemoteDescription(std::move(*remote_sdp), [this, epoch](){
        OnRemoteDescriptionApplied(epoch);
    }, [this, epoch](std::exception_ptr exp){
        OnRemoteDescriptionRejected(epoch, exp);
    });
}

void NegotiationStateMachine::HandleRemoteCandidate(const signaling::Message& message) {
    if (!connection_) {
        PLOG_WARNING << "Ignored candidate without connection in state: " << state_;
        return;
    }

    std::optional<sdp::Candidate> candidate;
    try {
        candidate.emplace(signaling::PayloadToCandidate(message.payload));
    } catch (const std::invalid_argument& exp) {
        PLOG_WARNING << "Ignored malformed candidate: " << exp.what();
        return;
    }

    if (connection_->IsLocalEcho(*candidate)) {
        PLOG_VERBOSE << "Dropped the echo of local candidate.";
        return;
    }
    connection_->AddRemoteCandidate(std::move(*candidate));
}

void NegotiationStateMachine::OnConnectionEvent(uint64_t epoch, Connection::Event event) {
    RTC_RUN_ON(task_queue_);
    if (IsStale(epoch) || !connection_ || connection_->epoch() != epoch) {
        return;
    }
    std::visit(overloaded {
        [this](Connection::CandidateGathered& e) {
            HandleLocalCandidate(std::move(e.candidate));
        },
        [this](Connection::TransportStateChanged& e) {
            HandleTransportState(e.state);
        },
        [this](Connection::RemoteStreamArrived& e) {
            HandleRemoteStream(std::move(e.stream));
        }
    }, event);
}

void NegotiationStateMachine::HandleLocalCandidate(sdp::Candidate candidate) {
    if (state_ != State::AWAITING_ANSWER && 
        state_ != State::AWAITING_OFFER && 
        state_ != State::NEGOTIATING) {
        PLOG_DEBUG << "Dropped local candidate in state: " << state_;
        return;
    }
    connection_->RecordFlushedCandidate(candidate);
    dependencies_.signaling_bus->Publish(signaling::Message::Candidate(candidate, role_));
}

void NegotiationStateMachine::HandleTransportState(PeerTransport::State state) {
    connection_->UpdateState(state);
    observer_->OnTransportStateChanged(state);
    switch (state) {
    case PeerTransport::State::CONNECTED:
        if (state_ == State::NEGOTIATING) {
            // Cancels the pending connect timeout.
            ++negotiation_attempt_;
            SetState(State::CONNECTED);
        } else {
            PLOG_WARNING << "Transport connected in state: " << state_;
        }
        break;
    case PeerTransport::State::DISCONNECTED:
    case PeerTransport::State::FAILED: {
        std::ostringstream reason;
        reason << "transport " << state;
        CloseOnFailure(reason.str());
        break;
    }
    default:
        break;
    }
}

void NegotiationStateMachine::HandleRemoteStream(std::shared_ptr<MediaStream> stream) {
    PLOG_INFO << "Remote stream arrived: " << stream->id();
    dependencies_.media_surface->AttachRemoteStream(std::move(stream));
    observer_->OnRemoteStreamArrived();
}

void NegotiationStateMachine::CreateConnection(uint64_t epoch) {
    // At most one connection per epoch.
    connection_.reset();
    try {
        auto transport = dependencies_.transport_factory->CreatePeerTransport(config_.rtc_config);
        connection_ = std::make_unique<Connection>(epoch, role_, std::move(transport), task_queue_, 
            [this](uint64_t epoch, Connection::Event event){
                OnConnectionEvent(epoch, std::move(event));
            });
    } catch (const std::exception& exp) {
        CloseOnFailure(std::string("failed to create connection: ") + exp.what());
    }
}

void NegotiationStateMachine::Subscribe(uint64_t epoch) {
    // Fully unsubscribed before a new one is created.
    subscription_.Reset();
    auto* bus = dependencies_.signaling_bus;
    subscription_ = signaling::ScopedSubscription(bus, bus->Subscribe([this, epoch](const signaling::Message& message){
        OnMessage(epoch, message);
    }));
}

void NegotiationStateMachine::ScheduleConnectTimeout(uint64_t epoch) {
    if (!config_.connect_timeout) {
        return;
    }
    const int attempt = ++negotiation_attempt_;
    task_queue_->PostDelayed(*config_.connect_timeout, ToQueuedTask(task_safety_, [this, epoch, attempt](){
        OnConnectTimeout(epoch, attempt);
    }));
}

void NegotiationStateMachine::CloseOnFailure(const std::string& reason) {
    PLOG_WARNING << "Closing negotiation, reason: " << reason;
    Teardown();
    SetState(State::CLOSED);
    observer_->OnSessionError({SessionError::Kind::TRANSPORT, kTransportFailedMessage});
}

void NegotiationStateMachine::Teardown() {
    subscription_.Reset();
    step_in_flight_ = false;
    ++negotiation_attempt_;
    if (connection_) {
        // Stops the local media and closes the transport.
        connection_.reset();
        dependencies_.media_surface->Detach(MediaSurface::Slot::LOCAL);
        dependencies_.media_surface->Detach(MediaSurface::Slot::REMOTE);
    }
}

void NegotiationStateMachine::SetState(State state) {
    if (state_ == state) {
        return;
    }
    PLOG_INFO << "Negotiation state changed: " << state_ << " -> " << state;
    state_ = state;
    observer_->OnNegotiationStateChanged(state);
}

bool NegotiationStateMachine::IsStale(uint64_t epoch) const {
    return epoch != epoch_;
}

std::ostream& operator<<(std::ostream& out, NegotiationStateMachine::State state) {
    using State = NegotiationStateMachine::State;
    switch (state) {
    case State::IDLE:
        return out << "idle";
    case State::AWAITING_ANSWER:
        return out << "awaiting_answer";
    case State::AWAITING_OFFER:
        return out << "awaiting_offer";
    case State::NEGOTIATING:
        return out << "negotiating";
    case State::CONNECTED:
        return out << "connected";
    case State::CLOSED:
        return out << "closed";
    default:
        return out << "unknown";
    }
}

} // namespace pairrtc
