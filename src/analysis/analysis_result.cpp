#include "analysis/analysis_result.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

using json = nlohmann::json;

namespace pairrtc {
namespace {

const json& RequiredField(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) {
        throw std::invalid_argument(std::string("Missing field in analysis result: ") + key);
    }
    return *it;
}
    
} // namespace

AnalysisResult ParseAnalysisResult(const std::string& json_text, int64_t timestamp_ms) {
    try {
        const json object = json::parse(json_text);
        if (!object.is_object()) {
            throw std::invalid_argument("Analysis result is not a JSON object.");
        }
        AnalysisResult result;
        result.timestamp_ms = timestamp_ms;
        result.summary = RequiredField(object, "summary").get<std::string>();
        result.objects = RequiredField(object, "objects").get<std::vector<std::string>>();
        result.threat_level = ToSeverity(RequiredField(object, "threatLevel").get<std::string>());
        result.detailed_log = RequiredField(object, "detailedLog").get<std::string>();
        return result;
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Malformed analysis result: ") + e.what());
    }
}

std::string ToString(AnalysisResult::Severity severity) {
    switch (severity) {
    case AnalysisResult::Severity::LOW:
        return "Low";
    case AnalysisResult::Severity::MEDIUM:
        return "Medium";
    case AnalysisResult::Severity::HIGH:
        return "High";
    default:
        RTC_NOTREACHED();
        return "Unknown";
    }
}

AnalysisResult::Severity ToSeverity(const std::string& str) {
    if (str == "Low") {
        return AnalysisResult::Severity::LOW;
    } else if (str == "Medium") {
        return AnalysisResult::Severity::MEDIUM;
    } else if (str == "High") {
        return AnalysisResult::Severity::HIGH;
    } else {
        throw std::invalid_argument("Unknown threat level: " + str);
    }
}

std::ostream& operator<<(std::ostream& out, AnalysisResult::Severity severity) {
    return out << ToString(severity);
}

} // namespace pairrtc
