#include "rtc/sdp/sdp_description.hpp"
#include "common/utils_string.hpp"

#include <plog/Log.h>

#include <sstream>

namespace pairrtc {
namespace sdp {

Description Description::Parser::Parse(const std::string& sdp, Type type) {
    std::string session_id;
    std::optional<std::string> ice_ufrag;
    std::optional<std::string> ice_pwd;
    std::optional<std::string> fingerprint;
    std::vector<Media> medias;

    auto lines = utils::string::split_lines(sdp);
    if (lines.empty() || lines.front() != "v=0") {
        throw std::invalid_argument("Invalid SDP: missing version line");
    }

    for (const auto& line : lines) {
        if (utils::string::match_prefix(line, "m=")) {
            // m=<media> <port> <proto> <fmt> ...
            std::istringstream iss(line.substr(2));
            std::string kind;
            iss >> kind;
            Media media;
            if (kind == "audio") {
                media.kind = Media::Kind::AUDIO;
            } else if (kind == "video") {
                media.kind = Media::Kind::VIDEO;
            } else if (kind == "application") {
                media.kind = Media::Kind::APPLICATION;
            } else {
                throw std::invalid_argument("Invalid SDP: unknown media kind " + kind);
            }
            // The index is used as mid until 'a=mid' shows up.
            media.mid = std::to_string(medias.size());
            medias.push_back(std::move(media));
        } else if (utils::string::match_prefix(line, "o=")) {
            std::istringstream iss(line.substr(2));
            std::string username;
            iss >> username >> session_id;
        } else if (utils::string::match_prefix(line, "a=")) {
            auto [key, value] = utils::string::parse_pair(std::string_view(line).substr(2));
            if (key == "ice-ufrag") {
                ice_ufrag.emplace(value);
            } else if (key == "ice-pwd") {
                ice_pwd.emplace(value);
            } else if (key == "fingerprint") {
                // a=fingerprint:sha-256 XX:XX:...
                if (auto separator = value.find(' '); separator != std::string_view::npos) {
                    fingerprint.emplace(value.substr(separator + 1));
                } else {
                    throw std::invalid_argument("Invalid SDP: malformed fingerprint");
                }
            } else if (key == "mid") {
                if (medias.empty()) {
                    throw std::invalid_argument("Invalid SDP: mid outside of media section");
                }
                medias.back().mid = std::string(value);
            } else if (!medias.empty() && 
                       (key == "sendrecv" || key == "sendonly" || key == "recvonly" || key == "inactive")) {
                medias.back().direction = ToDirection(std::string(key));
            }
        }
    }

    PLOG_VERBOSE << "Parsed " << type << " sdp with " << medias.size() << " media line(s).";

    return Description(type, 
                       std::move(session_id), 
                       std::move(ice_ufrag), 
                       std::move(ice_pwd), 
                       std::move(fingerprint), 
                       std::move(medias));
}
    
} // namespace sdp
} // namespace pairrtc
