#include "signaling/signaling_message.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace pairrtc {
namespace signaling {
namespace {

using json = nlohmann::json;

Message::Kind ToKind(const std::string& kind_string) {
    if (kind_string == "Offer") {
        return Message::Kind::OFFER;
    } else if (kind_string == "Answer") {
        return Message::Kind::ANSWER;
    } else if (kind_string == "Candidate") {
        return Message::Kind::CANDIDATE;
    }
    throw std::invalid_argument("Unknown message kind: " + kind_string);
}

} // namespace

Message Message::Offer(const sdp::Description& description, Role sender_role) {
    return Message{Kind::OFFER, DescriptionToPayload(description), sender_role};
}

Message Message::Answer(const sdp::Description& description, Role sender_role) {
    return Message{Kind::ANSWER, DescriptionToPayload(description), sender_role};
}

Message Message::Candidate(const sdp::Candidate& candidate, Role sender_role) {
    return Message{Kind::CANDIDATE, CandidateToPayload(candidate), sender_role};
}

std::string Message::Serialize() const {
    json json_message = {
        {"kind", ToString(kind)},
        {"payload", payload},
        {"senderRole", ToString(sender_role)}
    };
    return json_message.dump();
}

Message Message::Deserialize(const std::string& text) {
    try {
        auto json_message = json::parse(text);
        if (!json_message.is_object()) {
            throw std::invalid_argument("Signaling message is not an object");
        }
        if (!json_message.contains("payload") || !json_message["payload"].is_object()) {
            throw std::invalid_argument("Signaling message has no payload");
        }
        Message message;
        message.kind = ToKind(json_message.at("kind").get<std::string>());
        message.payload = json_message["payload"];
        message.sender_role = ToRole(json_message.value("senderRole", "Idle"));
        return message;
    } catch (const json::exception& exp) {
        throw std::invalid_argument(std::string("Malformed signaling message: ") + exp.what());
    }
}

json DescriptionToPayload(const sdp::Description& description) {
    return {
        {"type", sdp::ToString(description.type())},
        {"sdp", description.GenerateSDP("\r\n")}
    };
}

sdp::Description PayloadToDescription(const json& payload) {
    try {
        const std::string type = payload.at("type").get<std::string>();
        const std::string sdp = payload.at("sdp").get<std::string>();
        sdp::Type sdp_type = sdp::ToType(type);
        if (sdp_type != sdp::Type::OFFER && sdp_type != sdp::Type::ANSWER) {
            throw std::invalid_argument("Unexpected sdp type in payload: " + type);
        }
        return sdp::Description::Parser::Parse(sdp, sdp_type);
    } catch (const json::exception& exp) {
        throw std::invalid_argument(std::string("Malformed description payload: ") + exp.what());
    }
}

json CandidateToPayload(const sdp::Candidate& candidate) {
    return {
        {"candidate", std::string(candidate)},
        {"sdpMid", candidate.mid()},
        {"sdpMLineIndex", candidate.mline_index()}
    };
}

sdp::Candidate PayloadToCandidate(const json& payload) {
    try {
        std::string candidate = payload.at("candidate").get<std::string>();
        std::string sdp_mid = payload.value("sdpMid", "");
        int sdp_mlineindex = payload.value("sdpMLineIndex", 0);
        return sdp::Candidate(std::move(candidate), std::move(sdp_mid), sdp_mlineindex);
    } catch (const json::exception& exp) {
        throw std::invalid_argument(std::string("Malformed candidate payload: ") + exp.what());
    }
}

std::string ToString(Message::Kind kind) {
    switch (kind) {
    case Message::Kind::OFFER:
        return "Offer";
    case Message::Kind::ANSWER:
        return "Answer";
    default:
        return "Candidate";
    }
}

std::ostream& operator<<(std::ostream& out, Message::Kind kind) {
    return out << ToString(kind);
}

} // namespace signaling
} // namespace pairrtc
