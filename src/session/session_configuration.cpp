#include "session/session_configuration.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace pairrtc {

SessionConfiguration::SessionConfiguration() {
    rtc_config.ice_servers.emplace_back(kDefaultStunServerUrl);
}

SessionConfiguration SessionConfiguration::FromJson(const std::string& json_text) {
    SessionConfiguration config;
    try {
        auto json_config = json::parse(json_text);
        if (!json_config.is_object()) {
            throw std::invalid_argument("Session configuration is not an object");
        }

        if (json_config.contains("channelName")) {
            config.channel_name = json_config["channelName"].get<std::string>();
            if (config.channel_name.empty()) {
                throw std::invalid_argument("Empty channel name");
            }
        }

        if (json_config.contains("iceServers")) {
            config.rtc_config.ice_servers.clear();
            for (const auto& jserver : json_config["iceServers"]) {
                config.rtc_config.ice_servers.emplace_back(jserver.get<std::string>());
            }
        }

        if (json_config.contains("media")) {
            auto jmedia = json_config["media"];
            config.media_constraints.audio = jmedia.value("audio", config.media_constraints.audio);
            config.media_constraints.video = jmedia.value("video", config.media_constraints.video);
        }

        if (json_config.contains("connectTimeoutMs")) {
            int64_t timeout_ms = json_config["connectTimeoutMs"].get<int64_t>();
            if (timeout_ms <= 0) {
                throw std::invalid_argument("Connect timeout must be positive");
            }
            config.connect_timeout = TimeDelta::Millis(timeout_ms);
        }

        if (json_config.contains("analysis")) {
            auto janalysis = json_config["analysis"];
            config.analysis_frame_count = janalysis.value("frameCount", config.analysis_frame_count);
            if (config.analysis_frame_count < 1) {
                throw std::invalid_argument("Analysis needs at least one frame");
            }
            int64_t interval_ms = janalysis.value("frameIntervalMs", config.analysis_frame_interval.ms());
            if (interval_ms < 0) {
                throw std::invalid_argument("Negative analysis frame interval");
            }
            config.analysis_frame_interval = TimeDelta::Millis(interval_ms);
        }

        if (json_config.contains("logLevel")) {
            config.log_level = logging::LevelFromString(json_config["logLevel"].get<std::string>());
        }
    } catch (const json::exception& exp) {
        throw std::invalid_argument(std::string("Malformed session configuration: ") + exp.what());
    }
    return config;
}

SessionConfiguration SessionConfiguration::FromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::invalid_argument("Failed to open session configuration: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    PLOG_INFO << "Loading session configuration from " << path;
    return FromJson(buffer.str());
}

} // namespace pairrtc
