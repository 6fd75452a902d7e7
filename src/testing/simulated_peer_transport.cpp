#include "testing/simulated_peer_transport.hpp"
#include "common/utils_random.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <stdexcept>

namespace pairrtc {
namespace {

constexpr size_t kIceUfragLength = 4;
constexpr size_t kIcePwdLength = 24;
constexpr size_t kFingerprintBytes = 32;

sdp::Direction DirectionFor(bool has_local_track) {
    return has_local_track ? sdp::Direction::SEND_RECV : sdp::Direction::RECV_ONLY;
}

} // namespace

SimulatedPeerTransport::SimulatedPeerTransport(const RtcConfiguration& config, 
                                               Options options, 
                                               TaskQueue* network_queue, 
                                               DestroyedCallback on_destroyed) 
    : config_(config),
      options_(options),
      network_queue_(network_queue),
      on_destroyed_(std::move(on_destroyed)),
      ice_ufrag_(utils::random::random_string(kIceUfragLength)),
      ice_pwd_(utils::random::random_string(kIcePwdLength)),
      fingerprint_(utils::random::random_hex_bytes(kFingerprintBytes)) {}

SimulatedPeerTransport::~SimulatedPeerTransport() {
    if (on_destroyed_) {
        on_destroyed_(this);
    }
}

PeerTransport::State SimulatedPeerTransport::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool SimulatedPeerTransport::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::shared_ptr<MediaStream> SimulatedPeerTransport::local_stream() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_stream_;
}

std::optional<sdp::Description> SimulatedPeerTransport::local_description() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_sdp_;
}

std::optional<sdp::Description> SimulatedPeerTransport::remote_description() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remote_sdp_;
}

std::vector<sdp::Candidate> SimulatedPeerTransport::local_candidates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_candidates_;
}

std::vector<sdp::Candidate> SimulatedPeerTransport::remote_candidates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remote_candidates_;
}

void SimulatedPeerTransport::AddLocalStream(std::shared_ptr<MediaStream> stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    local_stream_ = std::move(stream);
}

void SimulatedPeerTransport::CreateOffer(SDPCreateSuccessCallback on_success, 
                                         FailureCallback on_failure) {
    CreateLocalDescription(sdp::Type::OFFER, std::move(on_success), std::move(on_failure));
}

void SimulatedPeerTransport::CreateAnswer(SDPCreateSuccessCallback on_success, 
                                          FailureCallback on_failure) {
    CreateLocalDescription(sdp::Type::ANSWER, std::move(on_success), std::move(on_failure));
}

void SimulatedPeerTransport::SetRemoteDescription(sdp::Description remote_sdp,
                                                  SDPSetSuccessCallback on_success, 
                                                  FailureCallback on_failure) {
    network_queue_->Post(ToQueuedTask(task_safety_, 
        [this, remote_sdp=std::move(remote_sdp), on_success=std::move(on_success), on_failure=std::move(on_failure)](){
        try {
            std::lock_guard<std::mutex> lock(mutex_);
            ValidateRemoteDescription(remote_sdp);
            remote_sdp_.emplace(remote_sdp);
        } catch (const std::exception& e) {
            PLOG_WARNING << "Failed to set remote sdp: " << e.what();
            on_failure(std::current_exception());
            return;
        }
        on_success();
        MaybeConnect();
    }));
}

void SimulatedPeerTransport::AddRemoteCandidate(const sdp::Candidate& candidate) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw std::logic_error("Transport is closed.");
        }
        if (!remote_sdp_) {
            throw std::logic_error("Got a remote candidate without remote sdp.");
        }
        if (!remote_sdp_->HasMid(candidate.mid())) {
            throw std::logic_error("Got a remote candidate with unknown mid: " + candidate.mid());
        }
        remote_candidates_.push_back(candidate);
    }
    network_queue_->Post(ToQueuedTask(task_safety_, [this](){
        MaybeConnect();
    }));
}

void SimulatedPeerTransport::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    state_ = State::CLOSED;
}

void SimulatedPeerTransport::SimulateFailure() {
    network_queue_->Post(ToQueuedTask(task_safety_, [this](){
        UpdateState(State::FAILED);
    }));
}

void SimulatedPeerTransport::SimulateDisconnect() {
    network_queue_->Post(ToQueuedTask(task_safety_, [this](){
        UpdateState(State::DISCONNECTED);
    }));
}

// Private methods
void SimulatedPeerTransport::CreateLocalDescription(sdp::Type type, 
                                                    SDPCreateSuccessCallback on_success, 
                                                    FailureCallback on_failure) {
    network_queue_->Post(ToQueuedTask(task_safety_, 
        [this, type, on_success=std::move(on_success), on_failure=std::move(on_failure)](){
        std::optional<sdp::Description> local_sdp;
        try {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                throw std::logic_error("Transport is closed.");
            }
            if (local_sdp_) {
                throw std::logic_error("Local sdp was created already.");
            }
            if ((type == sdp::Type::OFFER && options_.fail_create_offer) ||
                (type == sdp::Type::ANSWER && options_.fail_create_answer)) {
                throw std::runtime_error("Failed to create " + sdp::ToString(type));
            }
            if (type == sdp::Type::ANSWER && (!remote_sdp_ || remote_sdp_->type() != sdp::Type::OFFER)) {
                throw std::logic_error("Creating an answer without remote offer.");
            }
            local_sdp.emplace(BuildLocalDescription(type));
            local_sdp_ = local_sdp;
        } catch (const std::exception& e) {
            PLOG_WARNING << "Failed to create local sdp: " << e.what();
            on_failure(std::current_exception());
            return;
        }
        on_success(std::move(*local_sdp));
        GatherCandidates();
        MaybeConnect();
    }));
}

sdp::Description SimulatedPeerTransport::BuildLocalDescription(sdp::Type type) const {
    const bool has_audio = local_stream_ && local_stream_->HasAudio();
    const bool has_video = local_stream_ && local_stream_->HasVideo();
    sdp::Description::Builder builder(type);
    builder.set_ice_ufrag(ice_ufrag_)
           .set_ice_pwd(ice_pwd_)
           .set_fingerprint(fingerprint_);
    if (type == sdp::Type::OFFER) {
        int mid = 0;
        if (has_audio) {
            builder.AddMedia(sdp::Description::Media::Kind::AUDIO, std::to_string(mid++));
        }
        if (has_video) {
            builder.AddMedia(sdp::Description::Media::Kind::VIDEO, std::to_string(mid++));
        }
        if (mid == 0) {
            builder.AddMedia(sdp::Description::Media::Kind::APPLICATION, "0");
        }
    } else {
        // Reciprocates the medias of the remote offer.
        remote_sdp_->ForEach([&](const sdp::Description::Media& media){
            switch (media.kind) {
            case sdp::Description::Media::Kind::AUDIO:
                builder.AddMedia(media.kind, media.mid, DirectionFor(has_audio));
                break;
            case sdp::Description::Media::Kind::VIDEO:
                builder.AddMedia(media.kind, media.mid, DirectionFor(has_video));
                break;
            default:
                builder.AddMedia(media.kind, media.mid);
                break;
            }
        });
    }
    return builder.Build();
}

void SimulatedPeerTransport::ValidateRemoteDescription(const sdp::Description& remote_sdp) const {
    if (closed_) {
        throw std::logic_error("Transport is closed.");
    }
    if (remote_sdp_) {
        throw std::logic_error("Remote sdp was set already.");
    }
    const sdp::Type expected_type = local_sdp_ ? sdp::Type::ANSWER : sdp::Type::OFFER;
    if (remote_sdp.type() != expected_type) {
        throw std::logic_error("Unexpected remote sdp type: " + sdp::ToString(remote_sdp.type()));
    }
    if (!remote_sdp.ice_ufrag()) {
        throw std::invalid_argument("Remote sdp has no ICE user fragment");
    }
    if (!remote_sdp.ice_pwd()) {
        throw std::invalid_argument("Remote sdp has no ICE password");
    }
    if (!remote_sdp.fingerprint()) {
        throw std::invalid_argument("Remote sdp has no valid fingerprint");
    }
    if (!remote_sdp.HasMedia()) {
        throw std::invalid_argument("Remote sdp has no media line");
    }
    if (*remote_sdp.ice_ufrag() == ice_ufrag_ && *remote_sdp.ice_pwd() == ice_pwd_) {
        throw std::logic_error("Got a local sdp as remote sdp");
    }
}

std::shared_ptr<MediaStream> SimulatedPeerTransport::BuildRemoteStream() const {
    auto stream = std::make_shared<MediaStream>("remote-" + remote_sdp_->session_id());
    remote_sdp_->ForEach([&](const sdp::Description::Media& media){
        if (media.direction != sdp::Direction::SEND_RECV && 
            media.direction != sdp::Direction::SEND_ONLY) {
            return;
        }
        if (media.kind == sdp::Description::Media::Kind::AUDIO) {
            stream->AddTrack(std::make_shared<MediaStreamTrack>(MediaStreamTrack::Kind::AUDIO, stream->id() + "-audio"));
        } else if (media.kind == sdp::Description::Media::Kind::VIDEO) {
            stream->AddTrack(std::make_shared<MediaStreamTrack>(MediaStreamTrack::Kind::VIDEO, stream->id() + "-video"));
        }
    });
    return stream;
}

void SimulatedPeerTransport::GatherCandidates() {
    std::vector<sdp::Candidate> candidates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !local_sdp_) {
            return;
        }
        const std::string mid = local_sdp_->bundle_id();
        for (size_t i = 0; i < options_.host_candidate_count; ++i) {
            // Random foundations and ports keep the peers apart.
            std::string line = "candidate:" + utils::random::random_string(8) + 
                               " 1 udp " + std::to_string(2122260223 - i) + 
                               " 192.168." + std::to_string(utils::random::random<int>(0, 255)) + 
                               "." + std::to_string(utils::random::random<int>(2, 254)) + 
                               " " + std::to_string(utils::random::random<int>(config_.port_range_begin, config_.port_range_end)) + 
                               " typ host";
            candidates.emplace_back(std::move(line), mid, 0);
        }
        local_candidates_ = candidates;
    }
    for (auto& candidate : candidates) {
        PLOG_VERBOSE << "Gathered local candidate: " << candidate;
        SignalCandidateGathered(std::move(candidate));
    }
}

void SimulatedPeerTransport::MaybeConnect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!options_.auto_connect || connect_scheduled_ || closed_ || 
            state_ != State::NEW || !local_sdp_ || !remote_sdp_ || 
            remote_candidates_.empty()) {
            return;
        }
        connect_scheduled_ = true;
    }
    UpdateState(State::CONNECTING);
    network_queue_->PostDelayed(options_.connect_delay, ToQueuedTask(task_safety_, [this](){
        std::shared_ptr<MediaStream> remote_stream;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || state_ != State::CONNECTING) {
                return;
            }
            remote_stream = BuildRemoteStream();
        }
        UpdateState(State::CONNECTED);
        SignalRemoteStream(remote_stream);
    }));
}

void SimulatedPeerTransport::UpdateState(State state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || state_ == state) {
            return;
        }
        state_ = state;
    }
    PLOG_DEBUG << "Simulated transport state changed: " << state;
    SignalStateChanged(state);
}

// SimulatedPeerTransportFactory
SimulatedPeerTransportFactory::SimulatedPeerTransportFactory(TaskQueue* network_queue, 
                                                             SimulatedPeerTransport::Options options) 
    : network_queue_(network_queue),
      options_(options) {}

SimulatedPeerTransportFactory::~SimulatedPeerTransportFactory() = default;

void SimulatedPeerTransportFactory::set_options(SimulatedPeerTransport::Options options) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_ = options;
}

void SimulatedPeerTransportFactory::set_fail_create(bool fail_create) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_create_ = fail_create;
}

size_t SimulatedPeerTransportFactory::created_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_count_;
}

size_t SimulatedPeerTransportFactory::live_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_transports_.size();
}

SimulatedPeerTransport* SimulatedPeerTransportFactory::last_transport() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_transport_;
}

std::unique_ptr<PeerTransport> SimulatedPeerTransportFactory::CreatePeerTransport(const RtcConfiguration& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_create_) {
        throw std::runtime_error("Failed to create ICE transport.");
    }
    auto transport = std::make_unique<SimulatedPeerTransport>(config, options_, network_queue_, 
        std::bind(&SimulatedPeerTransportFactory::OnTransportDestroyed, this, std::placeholders::_1));
    ++created_count_;
    last_transport_ = transport.get();
    live_transports_.push_back(last_transport_);
    return transport;
}

// Private methods
void SimulatedPeerTransportFactory::OnTransportDestroyed(SimulatedPeerTransport* transport) {
    std::lock_guard<std::mutex> lock(mutex_);
    live_transports_.erase(std::remove(live_transports_.begin(), live_transports_.end(), transport), live_transports_.end());
    if (last_transport_ == transport) {
        last_transport_ = nullptr;
    }
}

} // namespace pairrtc
