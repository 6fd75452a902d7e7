#include "rtc/sdp/sdp_description.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <sstream>

namespace pairrtc {
namespace sdp {
namespace {

const char* MediaKindToString(Description::Media::Kind kind) {
    switch (kind) {
    case Description::Media::Kind::AUDIO:
        return "audio";
    case Description::Media::Kind::VIDEO:
        return "video";
    default:
        return "application";
    }
}

} // namespace

bool Description::Media::operator==(const Media& other) const {
    return kind == other.kind && mid == other.mid && direction == other.direction;
}

Description::Description(Type type, 
                         std::string session_id,
                         std::optional<std::string> ice_ufrag,
                         std::optional<std::string> ice_pwd,
                         std::optional<std::string> fingerprint,
                         std::vector<Media> medias) 
    : type_(type),
      session_id_(std::move(session_id)),
      ice_ufrag_(std::move(ice_ufrag)),
      ice_pwd_(std::move(ice_pwd)),
      fingerprint_(std::move(fingerprint)),
      medias_(std::move(medias)) {}

Description::~Description() = default;

Type Description::type() const {
    return type_;
}

const std::string& Description::session_id() const {
    return session_id_;
}

std::optional<std::string> Description::ice_ufrag() const {
    return ice_ufrag_;
}

std::optional<std::string> Description::ice_pwd() const {
    return ice_pwd_;
}

std::optional<std::string> Description::fingerprint() const {
    return fingerprint_;
}

std::string Description::bundle_id() const {
    return medias_.empty() ? "0" : medias_.front().mid;
}

bool Description::HasMid(const std::string_view mid) const {
    return std::any_of(medias_.begin(), medias_.end(), [mid](const Media& media){
        return media.mid == mid;
    });
}

bool Description::HasMedia() const {
    return !medias_.empty();
}

bool Description::HasAudio() const {
    return std::any_of(medias_.begin(), medias_.end(), [](const Media& media){
        return media.kind == Media::Kind::AUDIO;
    });
}

bool Description::HasVideo() const {
    return std::any_of(medias_.begin(), medias_.end(), [](const Media& media){
        return media.kind == Media::Kind::VIDEO;
    });
}

void Description::ForEach(std::function<void(const Media&)> handler) const {
    for (const auto& media : medias_) {
        handler(media);
    }
}

bool Description::operator==(const Description& other) const {
    return type_ == other.type_ &&
           ice_ufrag_ == other.ice_ufrag_ &&
           ice_pwd_ == other.ice_pwd_ &&
           fingerprint_ == other.fingerprint_ &&
           medias_ == other.medias_;
}

bool Description::operator!=(const Description& other) const {
    return !(*this == other);
}

Description::operator std::string() const {
    return GenerateSDP("\r\n");
}

std::string Description::GenerateSDP(const std::string eol) const {
    std::ostringstream sdp;

    // Header
    sdp << "v=0" << eol;
    sdp << "o=- " << session_id_ << " 0 IN IP4 127.0.0.1" << eol;
    sdp << "s=-" << eol;
    sdp << "t=0 0" << eol;

    // Bundle all medias
    if (!medias_.empty()) {
        sdp << "a=group:BUNDLE";
        for (const auto& media : medias_) {
            sdp << " " << media.mid;
        }
        sdp << eol;
    }

    // Session-level attributes
    if (ice_ufrag_) {
        sdp << "a=ice-ufrag:" << *ice_ufrag_ << eol;
    }
    if (ice_pwd_) {
        sdp << "a=ice-pwd:" << *ice_pwd_ << eol;
    }
    if (fingerprint_) {
        sdp << "a=fingerprint:sha-256 " << *fingerprint_ << eol;
    }

    // Media entries
    for (const auto& media : medias_) {
        if (media.kind == Media::Kind::APPLICATION) {
            sdp << "m=application 9 UDP/DTLS/SCTP webrtc-datachannel" << eol;
        } else {
            sdp << "m=" << MediaKindToString(media.kind) << " 9 UDP/TLS/RTP/SAVPF " 
                << (media.kind == Media::Kind::AUDIO ? "111" : "96") << eol;
        }
        sdp << "c=IN IP4 0.0.0.0" << eol;
        sdp << "a=mid:" << media.mid << eol;
        if (media.kind != Media::Kind::APPLICATION) {
            sdp << "a=" << media.direction << eol;
        }
    }

    return sdp.str();
}

std::ostream& operator<<(std::ostream& out, const Description& description) {
    return out << std::string(description);
}

} // namespace sdp
} // namespace pairrtc
