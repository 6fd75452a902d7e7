#ifndef _SIGNALING_SIGNALING_MESSAGE_H_
#define _SIGNALING_SIGNALING_MESSAGE_H_

#include "base/defines.hpp"
#include "signaling/role.hpp"
#include "rtc/sdp/candidate.hpp"
#include "rtc/sdp/sdp_description.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <iostream>

namespace pairrtc {
namespace signaling {

// The envelope relayed over the signaling channel, e.g.
// {"kind":"Offer","payload":{"type":"offer","sdp":"v=0..."},"senderRole":"Initiator"}
struct PAIRRTC_EXPORT Message {
    enum class Kind {
        OFFER,
        ANSWER,
        CANDIDATE
    };

    Kind kind;
    // Opaque to the channel.
    nlohmann::json payload;
    // For diagnostics only.
    Role sender_role = Role::IDLE;

    static Message Offer(const sdp::Description& description, Role sender_role);
    static Message Answer(const sdp::Description& description, Role sender_role);
    static Message Candidate(const sdp::Candidate& candidate, Role sender_role);

    std::string Serialize() const;
    // Throws std::invalid_argument if the text is not a valid envelope.
    static Message Deserialize(const std::string& text);
};

// Payload codecs, the decoders throw std::invalid_argument.
PAIRRTC_EXPORT nlohmann::json DescriptionToPayload(const sdp::Description& description);
PAIRRTC_EXPORT sdp::Description PayloadToDescription(const nlohmann::json& payload);
PAIRRTC_EXPORT nlohmann::json CandidateToPayload(const sdp::Candidate& candidate);
PAIRRTC_EXPORT sdp::Candidate PayloadToCandidate(const nlohmann::json& payload);

PAIRRTC_EXPORT std::string ToString(Message::Kind kind);
PAIRRTC_EXPORT std::ostream& operator<<(std::ostream& out, Message::Kind kind);

} // namespace signaling
} // namespace pairrtc

#endif
