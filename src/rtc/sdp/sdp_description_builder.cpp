#include "rtc/sdp/sdp_description.hpp"
#include "common/utils_random.hpp"

#include <cstdint>

namespace pairrtc {
namespace sdp {

Description::Builder::Builder(Type type) 
    : type_(type),
      session_id_(std::to_string(utils::random::random<uint32_t>(1, UINT32_MAX))) {}

Description::Builder::~Builder() = default;

Description::Builder& Description::Builder::set_session_id(std::string session_id) {
    session_id_ = std::move(session_id);
    return *this;
}

Description::Builder& Description::Builder::set_ice_ufrag(std::optional<std::string> ice_ufrag) {
    ice_ufrag_ = std::move(ice_ufrag);
    return *this;
}

Description::Builder& Description::Builder::set_ice_pwd(std::optional<std::string> ice_pwd) {
    ice_pwd_ = std::move(ice_pwd);
    return *this;
}

Description::Builder& Description::Builder::set_fingerprint(std::optional<std::string> fingerprint) {
    fingerprint_ = std::move(fingerprint);
    return *this;
}

Description::Builder& Description::Builder::AddMedia(Media::Kind kind, std::string mid, Direction direction) {
    medias_.push_back(Media{kind, std::move(mid), direction});
    return *this;
}

Description Description::Builder::Build() {
    return Description(type_, 
                       std::move(session_id_), 
                       std::move(ice_ufrag_), 
                       std::move(ice_pwd_), 
                       std::move(fingerprint_), 
                       std::move(medias_));
}
    
} // namespace sdp
} // namespace pairrtc
