#ifndef _RTC_SDP_DESCRIPTION_H_
#define _RTC_SDP_DESCRIPTION_H_

#include "base/defines.hpp"
#include "rtc/sdp/sdp_defines.hpp"

#include <string>
#include <vector>
#include <functional>
#include <optional>

namespace pairrtc {
namespace sdp {

// This class is not thread-safe, the caller MUST provide that.
class PAIRRTC_EXPORT Description {
public:
    // Media
    struct Media {
        enum class Kind {
            AUDIO,
            VIDEO,
            APPLICATION
        };
        Kind kind;
        std::string mid;
        Direction direction = Direction::SEND_RECV;

        bool operator==(const Media& other) const;
    };

// Builder
class PAIRRTC_EXPORT Builder {
public:
    Builder(Type type);
    ~Builder();

    Builder& set_session_id(std::string session_id);
    Builder& set_ice_ufrag(std::optional<std::string> ice_ufrag);
    Builder& set_ice_pwd(std::optional<std::string> ice_pwd);
    Builder& set_fingerprint(std::optional<std::string> fingerprint);
    Builder& AddMedia(Media::Kind kind, std::string mid, Direction direction = Direction::SEND_RECV);

    Description Build();

private:
    Type type_ = Type::UNSPEC;
    std::string session_id_;
    std::optional<std::string> ice_ufrag_ = std::nullopt;
    std::optional<std::string> ice_pwd_ = std::nullopt;
    std::optional<std::string> fingerprint_ = std::nullopt;
    std::vector<Media> medias_;
};

// Parser
class PAIRRTC_EXPORT Parser {
public:
    // Throws std::invalid_argument if the sdp is malformed.
    static Description Parse(const std::string& sdp, Type type);
};

// Description
public:
    ~Description();

    Type type() const;
    const std::string& session_id() const;
    std::optional<std::string> ice_ufrag() const;
    std::optional<std::string> ice_pwd() const;
    std::optional<std::string> fingerprint() const;
    // The mid of the first media, all medias are bundled.
    std::string bundle_id() const;

    bool HasMid(const std::string_view mid) const;
    bool HasMedia() const;
    bool HasAudio() const;
    bool HasVideo() const;
    void ForEach(std::function<void(const Media&)> handler) const;

    bool operator==(const Description& other) const;
    bool operator!=(const Description& other) const;
    
    operator std::string() const;
    std::string GenerateSDP(const std::string eol = "\r\n") const;

private:
    Description(Type type, 
                std::string session_id,
                std::optional<std::string> ice_ufrag,
                std::optional<std::string> ice_pwd,
                std::optional<std::string> fingerprint,
                std::vector<Media> medias);

private:
    Type type_;
    std::string session_id_;
    std::optional<std::string> ice_ufrag_;
    std::optional<std::string> ice_pwd_;
    std::optional<std::string> fingerprint_;
    std::vector<Media> medias_;
};

PAIRRTC_EXPORT std::ostream& operator<<(std::ostream& out, const Description& description);

} // namespace sdp
} // namespace pairrtc

#endif
