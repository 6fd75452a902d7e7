#include "rtc/sdp/sdp_description.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

namespace pairrtc {
namespace test {

using Media = sdp::Description::Media;

MY_TEST(SdpDescriptionTest, ParseOffer) {
    const std::string offer = 
        "v=0\r\n"
        "o=- 4611731400430051336 2 IN IP4 127.0.0.1\r\n"
        "s=-\r\n"
        "t=0 0\r\n"
        "a=group:BUNDLE 0 1\r\n"
        "m=audio 9 UDP/TLS/RTP/SAVPF 111\r\n"
        "c=IN IP4 0.0.0.0\r\n"
        "a=ice-ufrag:Zy3X\r\n"
        "a=ice-pwd:4jHgWbCOtb3W6ZrJkYRtXCkV\r\n"
        "a=fingerprint:sha-256 84:CC:63:E3:11:4D:1C:5F\r\n"
        "a=mid:0\r\n"
        "a=sendrecv\r\n"
        "m=video 9 UDP/TLS/RTP/SAVPF 96\r\n"
        "c=IN IP4 0.0.0.0\r\n"
        "a=mid:1\r\n"
        "a=recvonly\r\n";

    auto description = sdp::Description::Parser::Parse(offer, sdp::Type::OFFER);

    EXPECT_EQ(description.type(), sdp::Type::OFFER);
    EXPECT_EQ(description.session_id(), "4611731400430051336");
    EXPECT_EQ(description.ice_ufrag(), "Zy3X");
    EXPECT_EQ(description.ice_pwd(), "4jHgWbCOtb3W6ZrJkYRtXCkV");
    EXPECT_EQ(description.fingerprint(), "84:CC:63:E3:11:4D:1C:5F");
    EXPECT_TRUE(description.HasAudio());
    EXPECT_TRUE(description.HasVideo());
    EXPECT_TRUE(description.HasMid("1"));
    EXPECT_EQ(description.bundle_id(), "0");

    std::vector<sdp::Direction> directions;
    description.ForEach([&](const Media& media){
        directions.push_back(media.direction);
    });
    EXPECT_EQ(directions, std::vector<sdp::Direction>({sdp::Direction::SEND_RECV, sdp::Direction::RECV_ONLY}));
}

MY_TEST(SdpDescriptionTest, GenerateThenParse) {
    auto built = sdp::Description::Builder(sdp::Type::ANSWER)
                    .set_session_id("1234")
                    .set_ice_ufrag("ufrag")
                    .set_ice_pwd("password")
                    .set_fingerprint("AA:BB:CC")
                    .AddMedia(Media::Kind::AUDIO, "audio")
                    .AddMedia(Media::Kind::VIDEO, "video", sdp::Direction::SEND_ONLY)
                    .Build();

    auto parsed = sdp::Description::Parser::Parse(built.GenerateSDP(), sdp::Type::ANSWER);
    EXPECT_EQ(parsed, built);
    EXPECT_EQ(parsed.session_id(), "1234");
}

MY_TEST(SdpDescriptionTest, RejectMalformedSdp) {
    EXPECT_THROW(sdp::Description::Parser::Parse("", sdp::Type::OFFER), std::invalid_argument);
    EXPECT_THROW(sdp::Description::Parser::Parse("v=0\r\nm=text 9 X 0\r\n", sdp::Type::OFFER), std::invalid_argument);
    EXPECT_THROW(sdp::Description::Parser::Parse("v=0\r\na=mid:0\r\n", sdp::Type::OFFER), std::invalid_argument);
}

MY_TEST(SdpDescriptionTest, TypeString) {
    EXPECT_EQ(sdp::ToString(sdp::Type::OFFER), "offer");
    EXPECT_EQ(sdp::ToType("answer"), sdp::Type::ANSWER);
    EXPECT_EQ(sdp::ToType("bogus"), sdp::Type::UNSPEC);
}

} // namespace test
} // namespace pairrtc
