#include "rtc/sdp/candidate.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

#include <string>

namespace pairrtc {
namespace test {

MY_TEST(CandidateTest, CreateFromSDPLine) {
    const std::string sdp = "a=candidate:2550170968 1 udp 8265471 45.76.53.21 52823 typ relay raddr 113.246.193.40 rport 37467 generation 0 ufrag CE1b network-id 1 network-cost 10";

    sdp::Candidate candidate(sdp);

    EXPECT_EQ(candidate.foundation(), "2550170968");
    EXPECT_EQ(candidate.component_id(), 1u);
    EXPECT_EQ(candidate.transport_type(), sdp::Candidate::TransportType::UDP);
    EXPECT_EQ(candidate.priority(), 8265471u);
    EXPECT_EQ(candidate.hostname(), "45.76.53.21");
    EXPECT_EQ(candidate.server_port(), "52823");
    EXPECT_EQ(candidate.type(), sdp::Candidate::Type::RELAYED);
    EXPECT_EQ(candidate.mid(), "0");
}

MY_TEST(CandidateTest, ToString) {
    const std::string sdp = "candidate:1 1 UDP 2122252543 192.168.1.10 50000 typ host generation 0";

    sdp::Candidate candidate(sdp, "audio", 0);

    EXPECT_EQ(std::string(candidate), sdp);
    EXPECT_EQ(candidate.sdp_line(), "a=" + sdp);
    EXPECT_EQ(candidate.mid(), "audio");
    EXPECT_EQ(candidate.mline_index(), 0);
}

MY_TEST(CandidateTest, ParseTcpType) {
    sdp::Candidate candidate("candidate:3 1 tcp 1518280447 10.0.0.2 9 typ host tcptype active");
    EXPECT_EQ(candidate.transport_type(), sdp::Candidate::TransportType::TCP_ACTIVE);
    EXPECT_EQ(candidate.type(), sdp::Candidate::Type::HOST);
}

MY_TEST(CandidateTest, RejectMalformedLine) {
    EXPECT_THROW(sdp::Candidate("candidate:1 1 udp"), std::invalid_argument);
    EXPECT_THROW(sdp::Candidate("candidate:1 1 udp 100 10.0.0.1 5000 host"), std::invalid_argument);
    EXPECT_THROW(sdp::Candidate(""), std::invalid_argument);
}

MY_TEST(CandidateTest, Equality) {
    sdp::Candidate lhs("candidate:1 1 udp 100 10.0.0.1 5000 typ host", "0");
    sdp::Candidate rhs("a=candidate:1 1 udp 100 10.0.0.1 5000 typ host", "0");
    sdp::Candidate other_port("candidate:1 1 udp 100 10.0.0.1 5001 typ host", "0");
    EXPECT_EQ(lhs, rhs);
    EXPECT_NE(lhs, other_port);
}

} // namespace test
} // namespace pairrtc
