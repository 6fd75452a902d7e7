#ifndef _SESSION_SESSION_CONFIGURATION_H_
#define _SESSION_SESSION_CONFIGURATION_H_

#include "base/defines.hpp"
#include "common/logger.hpp"
#include "rtc/base/units/time_delta.hpp"
#include "rtc/media/media_stream.hpp"
#include "rtc/pc/peer_connection_configuration.hpp"

#include <optional>
#include <string>

namespace pairrtc {

constexpr char kDefaultChannelName[] = "p2p_signaling_channel";
constexpr char kDefaultStunServerUrl[] = "stun:stun.l.google.com:19302";

struct PAIRRTC_EXPORT SessionConfiguration {
    // Participants on the same channel negotiate with each other.
    std::string channel_name = kDefaultChannelName;
    RtcConfiguration rtc_config;
    MediaConstraints media_constraints;

    // Closes the session as a transport failure if not connected in 
    // time after the negotiation started. No limit if not set.
    std::optional<TimeDelta> connect_timeout = std::nullopt;

    // Analysis
    int analysis_frame_count = 3;
    TimeDelta analysis_frame_interval = TimeDelta::Millis(800);

    logging::Level log_level = logging::Level::INFO;

    // Uses the default STUN server.
    SessionConfiguration();

    // Throws std::invalid_argument if the json is malformed or has invalid values, e.g.
    // {
    //   "channelName": "p2p_signaling_channel",
    //   "iceServers": ["stun:stun.l.google.com:19302"],
    //   "media": {"audio": true, "video": true},
    //   "connectTimeoutMs": 15000,
    //   "analysis": {"frameCount": 3, "frameIntervalMs": 800},
    //   "logLevel": "info"
    // }
    static SessionConfiguration FromJson(const std::string& json_text);
    static SessionConfiguration FromFile(const std::string& path);
};

} // namespace pairrtc

#endif
