#include "analysis/analysis_result.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/defines.hpp"

namespace pairrtc {
namespace test {

MY_TEST(AnalysisResultTest, ParseServiceResponse) {
    const std::string text = R"({
        "summary": "Two people talking in a kitchen.",
        "objects": ["person", "person", "kettle"],
        "threatLevel": "High",
        "detailedLog": "One person raises a kettle."
    })";
    AnalysisResult result = ParseAnalysisResult(text, 1234);
    EXPECT_EQ(result.timestamp_ms, 1234);
    EXPECT_EQ(result.summary, "Two people talking in a kitchen.");
    EXPECT_EQ(result.objects, (std::vector<std::string>{"person", "person", "kettle"}));
    EXPECT_EQ(result.threat_level, AnalysisResult::Severity::HIGH);
    EXPECT_EQ(result.detailed_log, "One person raises a kettle.");
}

MY_TEST(AnalysisResultTest, RejectMalformedResponse) {
    EXPECT_THROW(ParseAnalysisResult("", 0), std::invalid_argument);
    EXPECT_THROW(ParseAnalysisResult("[]", 0), std::invalid_argument);
    EXPECT_THROW(ParseAnalysisResult(R"({"summary": "x", "objects": [], "threatLevel": "Low"})", 0), std::invalid_argument);
    EXPECT_THROW(ParseAnalysisResult(R"({"summary": "x", "objects": "person", "threatLevel": "Low", "detailedLog": ""})", 0), std::invalid_argument);
    EXPECT_THROW(ParseAnalysisResult(R"({"summary": "x", "objects": [], "threatLevel": "Severe", "detailedLog": ""})", 0), std::invalid_argument);
}

MY_TEST(AnalysisResultTest, SeverityNames) {
    EXPECT_EQ(ToString(AnalysisResult::Severity::LOW), "Low");
    EXPECT_EQ(ToString(AnalysisResult::Severity::MEDIUM), "Medium");
    EXPECT_EQ(ToSeverity("High"), AnalysisResult::Severity::HIGH);
    EXPECT_THROW(ToSeverity("low"), std::invalid_argument);
}

} // namespace test
} // namespace pairrtc
