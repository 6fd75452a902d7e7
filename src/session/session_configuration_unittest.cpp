#include "session/session_configuration.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

namespace pairrtc {
namespace test {

MY_TEST(SessionConfigurationTest, Defaults) {
    SessionConfiguration config;

    EXPECT_EQ(config.channel_name, "p2p_signaling_channel");
    ASSERT_EQ(config.rtc_config.ice_servers.size(), 1u);
    EXPECT_EQ(config.rtc_config.ice_servers[0].hostname(), "stun.l.google.com");
    EXPECT_EQ(config.rtc_config.ice_servers[0].port(), 19302);
    EXPECT_TRUE(config.media_constraints.audio);
    EXPECT_TRUE(config.media_constraints.video);
    EXPECT_FALSE(config.connect_timeout.has_value());
    EXPECT_EQ(config.analysis_frame_count, 3);
    EXPECT_EQ(config.analysis_frame_interval, TimeDelta::Millis(800));
}

MY_TEST(SessionConfigurationTest, FromJson) {
    auto config = SessionConfiguration::FromJson(R"({
        "channelName": "room-1",
        "iceServers": ["stun:stun.example.org:3478", "turn:bob:pwd@turn.example.org:3478?transport=tcp"],
        "media": {"audio": false},
        "connectTimeoutMs": 15000,
        "analysis": {"frameCount": 5, "frameIntervalMs": 200},
        "logLevel": "debug"
    })");

    EXPECT_EQ(config.channel_name, "room-1");
    ASSERT_EQ(config.rtc_config.ice_servers.size(), 2u);
    EXPECT_EQ(config.rtc_config.ice_servers[1].type(), IceServer::Type::TURN);
    EXPECT_EQ(config.rtc_config.ice_servers[1].relay_type(), IceServer::RelayType::TURN_TCP);
    EXPECT_FALSE(config.media_constraints.audio);
    EXPECT_TRUE(config.media_constraints.video);
    ASSERT_TRUE(config.connect_timeout.has_value());
    EXPECT_EQ(*config.connect_timeout, TimeDelta::Seconds(15));
    EXPECT_EQ(config.analysis_frame_count, 5);
    EXPECT_EQ(config.analysis_frame_interval, TimeDelta::Millis(200));
    EXPECT_EQ(config.log_level, logging::Level::DEBUG);
}

MY_TEST(SessionConfigurationTest, RejectInvalidValues) {
    EXPECT_THROW(SessionConfiguration::FromJson("{"), std::invalid_argument);
    EXPECT_THROW(SessionConfiguration::FromJson("[]"), std::invalid_argument);
    EXPECT_THROW(SessionConfiguration::FromJson(R"({"channelName": ""})"), std::invalid_argument);
    EXPECT_THROW(SessionConfiguration::FromJson(R"({"channelName": 1})"), std::invalid_argument);
    EXPECT_THROW(SessionConfiguration::FromJson(R"({"iceServers": ["ftp:example.org"]})"), std::invalid_argument);
    EXPECT_THROW(SessionConfiguration::FromJson(R"({"connectTimeoutMs": 0})"), std::invalid_argument);
    EXPECT_THROW(SessionConfiguration::FromJson(R"({"analysis": {"frameCount": 0}})"), std::invalid_argument);
    EXPECT_THROW(SessionConfiguration::FromJson(R"({"logLevel": "loud"})"), std::invalid_argument);
}

MY_TEST(SessionConfigurationTest, MissingFile) {
    EXPECT_THROW(SessionConfiguration::FromFile("/nonexistent/pairrtc.json"), std::invalid_argument);
}

} // namespace test
} // namespace pairrtc
