#ifndef _TESTING_SIMULATED_PEER_TRANSPORT_H_
#define _TESTING_SIMULATED_PEER_TRANSPORT_H_

#include "base/defines.hpp"
#include "rtc/base/task_utils/task_queue.hpp"
#include "rtc/base/task_utils/pending_task_safety_flag.hpp"
#include "rtc/base/units/time_delta.hpp"
#include "rtc/pc/peer_transport.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace pairrtc {

// SimulatedPeerTransport negotiates like a real one, and regards itself
// connected once both descriptions and a remote candidate are applied.
// The callbacks and the signals are invoked on `network_queue`.
class SimulatedPeerTransport final : public PeerTransport {
public:
    struct Options {
        size_t host_candidate_count = 2;
        bool auto_connect = true;
        TimeDelta connect_delay = TimeDelta::Millis(50);
        bool fail_create_offer = false;
        bool fail_create_answer = false;
    };
    using DestroyedCallback = std::function<void(SimulatedPeerTransport*)>;
public:
    SimulatedPeerTransport(const RtcConfiguration& config, 
                           Options options, 
                           TaskQueue* network_queue, 
                           DestroyedCallback on_destroyed = nullptr);
    ~SimulatedPeerTransport() override;

    State state() const;
    bool closed() const;
    std::shared_ptr<MediaStream> local_stream() const;
    std::optional<sdp::Description> local_description() const;
    std::optional<sdp::Description> remote_description() const;
    std::vector<sdp::Candidate> local_candidates() const;
    std::vector<sdp::Candidate> remote_candidates() const;

    // PeerTransport interface
    void AddLocalStream(std::shared_ptr<MediaStream> stream) override;
    void CreateOffer(SDPCreateSuccessCallback on_success, 
                     FailureCallback on_failure) override;
    void CreateAnswer(SDPCreateSuccessCallback on_success, 
                      FailureCallback on_failure) override;
    void SetRemoteDescription(sdp::Description remote_sdp,
                              SDPSetSuccessCallback on_success, 
                              FailureCallback on_failure) override;
    void AddRemoteCandidate(const sdp::Candidate& candidate) override;
    void Close() override;

    void SimulateFailure();
    void SimulateDisconnect();

private:
    void CreateLocalDescription(sdp::Type type, 
                                SDPCreateSuccessCallback on_success, 
                                FailureCallback on_failure);
    sdp::Description BuildLocalDescription(sdp::Type type) const;
    void ValidateRemoteDescription(const sdp::Description& remote_sdp) const;
    std::shared_ptr<MediaStream> BuildRemoteStream() const;
    void GatherCandidates();
    void MaybeConnect();
    void UpdateState(State state);

private:
    const RtcConfiguration config_;
    const Options options_;
    TaskQueue* const network_queue_;
    DestroyedCallback on_destroyed_;

    const std::string ice_ufrag_;
    const std::string ice_pwd_;
    const std::string fingerprint_;

    mutable std::mutex mutex_;
    State state_ = State::NEW;
    bool closed_ = false;
    bool connect_scheduled_ = false;
    std::shared_ptr<MediaStream> local_stream_ = nullptr;
    std::optional<sdp::Description> local_sdp_ = std::nullopt;
    std::optional<sdp::Description> remote_sdp_ = std::nullopt;
    std::vector<sdp::Candidate> local_candidates_;
    std::vector<sdp::Candidate> remote_candidates_;

    ScopedTaskSafety task_safety_;
};

// SimulatedPeerTransportFactory
class SimulatedPeerTransportFactory final : public PeerTransportFactory {
public:
    explicit SimulatedPeerTransportFactory(TaskQueue* network_queue, 
                                           SimulatedPeerTransport::Options options = {});
    ~SimulatedPeerTransportFactory() override;

    void set_options(SimulatedPeerTransport::Options options);
    // CreatePeerTransport throws std::runtime_error while set.
    void set_fail_create(bool fail_create);
    size_t created_count() const;
    size_t live_count() const;
    // Returns nullptr if the last created transport was destroyed.
    SimulatedPeerTransport* last_transport() const;

    std::unique_ptr<PeerTransport> CreatePeerTransport(const RtcConfiguration& config) override;

private:
    void OnTransportDestroyed(SimulatedPeerTransport* transport);

private:
    TaskQueue* const network_queue_;
    mutable std::mutex mutex_;
    SimulatedPeerTransport::Options options_;
    bool fail_create_ = false;
    size_t created_count_ = 0;
    std::vector<SimulatedPeerTransport*> live_transports_;
    SimulatedPeerTransport* last_transport_ = nullptr;
};

} // namespace pairrtc

#endif
