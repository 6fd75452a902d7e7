#ifndef _RTC_PC_PEER_TRANSPORT_H_
#define _RTC_PC_PEER_TRANSPORT_H_

#include "base/defines.hpp"
#include "rtc/pc/peer_connection_configuration.hpp"
#include "rtc/sdp/candidate.hpp"
#include "rtc/sdp/sdp_description.hpp"
#include "rtc/media/media_stream.hpp"

#include <sigslot.h>

#include <exception>
#include <functional>
#include <memory>
#include <iostream>

namespace pairrtc {

// PeerTransport is the ICE/DTLS machinery of one peer-to-peer connection.
// The signals may be emitted on any thread.
class PAIRRTC_EXPORT PeerTransport {
public:
    enum class State {
        NEW = 0,
        CONNECTING,
        CONNECTED,
        DISCONNECTED,
        FAILED,
        CLOSED
    };

    using SDPCreateSuccessCallback = std::function<void(sdp::Description sdp)>;
    using SDPSetSuccessCallback = std::function<void()>;
    using FailureCallback = std::function<void(std::exception_ptr)>;
public:
    virtual ~PeerTransport() = default;

    virtual void AddLocalStream(std::shared_ptr<MediaStream> stream) = 0;

    // Creates an offer and applies it as the local description.
    virtual void CreateOffer(SDPCreateSuccessCallback on_success, 
                             FailureCallback on_failure) = 0;
    // Creates an answer and applies it as the local description, 
    // the remote offer MUST be applied before.
    virtual void CreateAnswer(SDPCreateSuccessCallback on_success, 
                              FailureCallback on_failure) = 0;
    virtual void SetRemoteDescription(sdp::Description remote_sdp,
                                      SDPSetSuccessCallback on_success, 
                                      FailureCallback on_failure) = 0;
    // Throws std::logic_error if the candidate is rejected, e.g. no
    // remote description has been applied.
    virtual void AddRemoteCandidate(const sdp::Candidate& candidate) = 0;

    virtual void Close() = 0;

    // SHOULD connect slots after created instance immediately to avoiding racing.
    sigslot::signal1<sdp::Candidate> SignalCandidateGathered;
    sigslot::signal1<State> SignalStateChanged;
    sigslot::signal1<std::shared_ptr<MediaStream>> SignalRemoteStream;
};

// PeerTransportFactory
class PAIRRTC_EXPORT PeerTransportFactory {
public:
    virtual ~PeerTransportFactory() = default;
    virtual std::unique_ptr<PeerTransport> CreatePeerTransport(const RtcConfiguration& config) = 0;
};

PAIRRTC_EXPORT std::ostream& operator<<(std::ostream& out, PeerTransport::State state);

} // namespace pairrtc

#endif
