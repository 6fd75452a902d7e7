#include "rtc/pc/peer_connection_configuration.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

namespace pairrtc {
namespace test {

MY_TEST(IceServerTest, CreateFromStunURL) {
    const std::string url = "stun:stun.l.google.com:19302";
    IceServer ice_server(url);

    EXPECT_EQ(ice_server.hostname(), "stun.l.google.com");
    EXPECT_EQ(ice_server.port(), 19302);
    EXPECT_EQ(ice_server.type(), IceServer::Type::STUN);
    EXPECT_EQ(ice_server.url(), url);
}

MY_TEST(IceServerTest, CreateFromTurnURL) {
    const std::string url = "turn:192.158.29.39:3478?transport=udp";
    IceServer ice_server(url);

    EXPECT_EQ(ice_server.hostname(), "192.158.29.39");
    EXPECT_EQ(ice_server.port(), 3478);
    EXPECT_EQ(ice_server.type(), IceServer::Type::TURN);
    EXPECT_EQ(ice_server.relay_type(), IceServer::RelayType::TURN_UDP);
}

MY_TEST(IceServerTest, CreateFromTurnURLWithCredentials) {
    IceServer ice_server("turn:alice:secret@turn.example.org:443?transport=tcp");

    EXPECT_EQ(ice_server.username(), "alice");
    EXPECT_EQ(ice_server.password(), "secret");
    EXPECT_EQ(ice_server.hostname(), "turn.example.org");
    EXPECT_EQ(ice_server.port(), 443);
    EXPECT_EQ(ice_server.relay_type(), IceServer::RelayType::TURN_TCP);
}

MY_TEST(IceServerTest, DefaultPortOfTurns) {
    IceServer ice_server("turns:turn.example.org");

    EXPECT_EQ(ice_server.type(), IceServer::Type::TURN);
    EXPECT_EQ(ice_server.relay_type(), IceServer::RelayType::TURN_TLS);
    EXPECT_EQ(ice_server.port(), 5349);
}

MY_TEST(IceServerTest, RejectInvalidURL) {
    EXPECT_THROW(IceServer("http:example.org:80"), std::invalid_argument);
    EXPECT_THROW(IceServer("stun:example.org:notaport"), std::invalid_argument);
    EXPECT_THROW(IceServer("stun:example.org:70000"), std::invalid_argument);
}

} // namespace test
} // namespace pairrtc
