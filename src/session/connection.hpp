#ifndef _SESSION_CONNECTION_H_
#define _SESSION_CONNECTION_H_

#include "base/defines.hpp"
#include "signaling/role.hpp"
#include "rtc/base/task_utils/task_queue.hpp"
#include "rtc/base/task_utils/pending_task_safety_flag.hpp"
#include "rtc/pc/peer_transport.hpp"

#include <sigslot.h>

#include <deque>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace pairrtc {

// Connection is the single negotiation object of a role epoch. It 
// MUST be created, used and destroyed on `task_queue`.
class Connection final : public sigslot::has_slots<> {
public:
    // Transport events, posted onto the task queue.
    struct CandidateGathered {
        sdp::Candidate candidate;
    };
    struct TransportStateChanged {
        PeerTransport::State state;
    };
    struct RemoteStreamArrived {
        std::shared_ptr<MediaStream> stream;
    };
    using Event = std::variant<CandidateGathered, TransportStateChanged, RemoteStreamArrived>;
    using EventHandler = std::function<void(uint64_t epoch, Event event)>;

    using DescriptionCallback = std::function<void(sdp::Description description)>;
    using CompletionCallback = std::function<void()>;
    using FailureCallback = std::function<void(std::exception_ptr exp)>;
public:
    Connection(uint64_t epoch,
               Role role,
               std::unique_ptr<PeerTransport> transport,
               TaskQueue* task_queue,
               EventHandler event_handler);
    // Closes the transport and stops the attached local media.
    ~Connection() override;

    uint64_t epoch() const { return epoch_; }
    Role role() const { return role_; }
    PeerTransport::State state() const { return state_; }
    bool has_local_description() const { return local_sdp_.has_value(); }
    bool has_remote_description() const { return remote_sdp_.has_value(); }
    std::shared_ptr<MediaStream> local_media() const { return local_media_; }
    size_t pending_remote_candidate_count() const { return pending_remote_candidates_.size(); }
    const std::vector<sdp::Candidate>& flushed_local_candidates() const { return flushed_local_candidates_; }

    // Answer for the initiator and offer for the responder.
    sdp::Type expected_remote_type() const;

    void AttachLocalMedia(std::shared_ptr<MediaStream> stream);

    // Creates the offer for the initiator, or the answer for the responder,
    // and applies it as the local description.
    void CreateLocalDescription(DescriptionCallback on_success, FailureCallback on_failure);
    // The buffered remote candidates are applied in arrival order once 
    // the remote description is applied.
    void ApplyRemoteDescription(sdp::Description remote_sdp, 
                                CompletionCallback on_success, 
                                FailureCallback on_failure);
    void AddRemoteCandidate(sdp::Candidate candidate);

    void RecordFlushedCandidate(sdp::Candidate candidate);
    bool IsLocalEcho(const sdp::Description& description) const;
    bool IsLocalEcho(const sdp::Candidate& candidate) const;

    void UpdateState(PeerTransport::State state);

private:
    void ProcessRemoteCandidates();
    void ProcessRemoteCandidate(const sdp::Candidate& candidate);

    void OnCandidateGathered(sdp::Candidate candidate);
    void OnTransportStateChanged(PeerTransport::State state);
    void OnRemoteStream(std::shared_ptr<MediaStream> stream);
    void PostEvent(Event event);

private:
    DISALLOW_COPY_AND_ASSIGN(Connection);
    const uint64_t epoch_;
    const Role role_;
    std::unique_ptr<PeerTransport> transport_;
    TaskQueue* const task_queue_;
    EventHandler event_handler_;

    PeerTransport::State state_ = PeerTransport::State::NEW;
    bool creating_local_sdp_ = false;
    bool applying_remote_sdp_ = false;

    std::optional<sdp::Description> local_sdp_ = std::nullopt;
    std::optional<sdp::Description> remote_sdp_ = std::nullopt;
    std::shared_ptr<MediaStream> local_media_ = nullptr;

    std::deque<sdp::Candidate> pending_remote_candidates_;
    std::vector<sdp::Candidate> flushed_local_candidates_;

    ScopedTaskSafety task_safety_;
};

} // namespace pairrtc

#endif
