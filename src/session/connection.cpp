#include "session/connection.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace pairrtc {

Connection::Connection(uint64_t epoch,
                       Role role,
                       std::unique_ptr<PeerTransport> transport,
                       TaskQueue* task_queue,
                       EventHandler event_handler) 
    : epoch_(epoch),
      role_(role),
      transport_(std::move(transport)),
      task_queue_(task_queue),
      event_handler_(std::move(event_handler)) {
    if (!transport_) {
        throw std::invalid_argument("Connection created without transport.");
    }
    transport_->SignalCandidateGathered.connect(this, &Connection::OnCandidateGathered);
    transport_->SignalStateChanged.connect(this, &Connection::OnTransportStateChanged);
    transport_->SignalRemoteStream.connect(this, &Connection::OnRemoteStream);
    PLOG_VERBOSE << "Connection created, epoch: " << epoch_ << ", role: " << role_;
}

Connection::~Connection() {
    transport_->SignalCandidateGathered.disconnect(this);
    transport_->SignalStateChanged.disconnect(this);
    transport_->SignalRemoteStream.disconnect(this);
    transport_->Close();
    if (local_media_) {
        local_media_->Stop();
    }
    PLOG_VERBOSE << "Connection destroyed, epoch: " << epoch_;
}

sdp::Type Connection::expected_remote_type() const {
    return role_ == Role::INITIATOR ? sdp::Type::ANSWER : sdp::Type::OFFER;
}

void Connection::AttachLocalMedia(std::shared_ptr<MediaStream> stream) {
    if (local_media_) {
        throw std::logic_error("Local media is attached already.");
    }
    local_media_ = stream;
    transport_->AddLocalStream(std::move(stream));
}

void Connection::CreateLocalDescription(DescriptionCallback on_success, FailureCallback on_failure) {
    if (local_sdp_ || creating_local_sdp_) {
        on_failure(std::make_exception_ptr(std::logic_error("Local description is created already.")));
        return;
    }
    if (role_ == Role::RESPONDER && !remote_sdp_) {
        on_failure(std::make_exception_ptr(std::logic_error("Creating answer without remote offer.")));
        return;
    }
    creating_local_sdp_ = true;

    auto on_created = [this, task_queue=task_queue_, flag=task_safety_.flag(), on_success=std::move(on_success)](sdp::Description local_sdp) {
        task_queue->Post(ToQueuedTask(flag, [this, on_success, local_sdp=std::move(local_sdp)](){
            creating_local_sdp_ = false;
            local_sdp_.emplace(local_sdp);
            PLOG_DEBUG << "Local " << local_sdp.type() << " created.";
            on_success(local_sdp);
        }));
    };
    auto on_failed = [this, task_queue=task_queue_, flag=task_safety_.flag(), on_failure](std::exception_ptr exp) {
        task_queue->Post(ToQueuedTask(flag, [this, on_failure, exp](){
            creating_local_sdp_ = false;
            on_failure(exp);
        }));
    };

    if (role_ == Role::INITIATOR) {
        transport_->CreateOffer(std::move(on_created), std::move(on_failed));
    } else {
        transport_->CreateAnswer(std::move(on_created), std::move(on_failed));
    }
}

void Connection::ApplyRemoteDescription(sdp::Description remote_sdp, 
                                        CompletionCallback on_success, 
                                        FailureCallback on_failure) {
    if (remote_sdp_ || applying_remote_sdp_) {
        on_failure(std::make_exception_ptr(std::logic_error("Remote description is applied already.")));
        return;
    }
    if (remote_sdp.type() != expected_remote_type()) {
        on_failure(std::make_exception_ptr(std::logic_error("Unexpected remote sdp type: " + sdp::ToString(remote_sdp.type()) + 
                                                            " for role: " + ToString(role_))));
        return;
    }
    if (role_ == Role::INITIATOR && !local_sdp_) {
        on_failure(std::make_exception_ptr(std::logic_error("Applying answer without local offer.")));
        return;
    }
    applying_remote_sdp_ = true;

    auto on_applied = [this, task_queue=task_queue_, flag=task_safety_.flag(), on_success=std::move(on_success), remote_sdp]() {
        task_queue->Post(ToQueuedTask(flag, [this, on_success, remote_sdp](){
            applying_remote_sdp_ = false;
            remote_sdp_.emplace(remote_sdp);
            PLOG_DEBUG << "Remote " << remote_sdp.type() << " applied, flushing " 
                       << pending_remote_candidates_.size() << " buffered candidate(s).";
            ProcessRemoteCandidates();
            on_success();
        }));
    };
    auto on_failed = [this, task_queue=task_queue_, flag=task_safety_.flag(), on_failure](std::exception_ptr exp) {
        task_queue->Post(ToQueuedTask(flag, [this, on_failure, exp](){
            applying_remote_sdp_ = false;
            on_failure(exp);
        }));
    };

    transport_->SetRemoteDescription(std::move(remote_sdp), std::move(on_applied), std::move(on_failed));
}

void Connection::AddRemoteCandidate(sdp::Candidate candidate) {
    if (!remote_sdp_) {
        PLOG_DEBUG << "Buffered remote candidate before remote description: " << candidate;
        pending_remote_candidates_.push_back(std::move(candidate));
        return;
    }
    ProcessRemoteCandidate(candidate);
}

void Connection::RecordFlushedCandidate(sdp::Candidate candidate) {
    flushed_local_candidates_.push_back(std::move(candidate));
}

bool Connection::IsLocalEcho(const sdp::Description& description) const {
    return local_sdp_ && *local_sdp_ == description;
}

bool Connection::IsLocalEcho(const sdp::Candidate& candidate) const {
    return std::find(flushed_local_candidates_.begin(), 
                     flushed_local_candidates_.end(), 
                     candidate) != flushed_local_candidates_.end();
}

void Connection::UpdateState(PeerTransport::State state) {
    if (state_ == state) {
        return;
    }
    PLOG_DEBUG << "Connection state changed: " << state_ << " -> " << state;
    state_ = state;
}

// Private methods
void Connection::ProcessRemoteCandidates() {
    while (!pending_remote_candidates_.empty()) {
        auto candidate = std::move(pending_remote_candidates_.front());
        pending_remote_candidates_.pop_front();
        ProcessRemoteCandidate(candidate);
    }
}

void Connection::ProcessRemoteCandidate(const sdp::Candidate& candidate) {
    PLOG_VERBOSE << "Adding remote candidate: " << candidate;
    try {
        transport_->AddRemoteCandidate(candidate);
    } catch (const std::exception& exp) {
        PLOG_WARNING << "Remote candidate rejected: " << exp.what();
    }
}

void Connection::OnCandidateGathered(sdp::Candidate candidate) {
    PostEvent(CandidateGathered{std::move(candidate)});
}

void Connection::OnTransportStateChanged(PeerTransport::State state) {
    PostEvent(TransportStateChanged{state});
}

void Connection::OnRemoteStream(std::shared_ptr<MediaStream> stream) {
    PostEvent(RemoteStreamArrived{std::move(stream)});
}

void Connection::PostEvent(Event event) {
    if (!event_handler_) {
        return;
    }
    // The handler may destroy this connection.
    task_queue_->Post(ToQueuedTask(task_safety_, [handler=event_handler_, epoch=epoch_, event=std::move(event)](){
        handler(epoch, event);
    }));
}

} // namespace pairrtc
