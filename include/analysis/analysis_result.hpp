#ifndef _ANALYSIS_ANALYSIS_RESULT_H_
#define _ANALYSIS_ANALYSIS_RESULT_H_

#include "base/defines.hpp"

#include <string>
#include <vector>
#include <iostream>

namespace pairrtc {

// AnalysisResult
struct PAIRRTC_EXPORT AnalysisResult {
    enum class Severity {
        LOW,
        MEDIUM,
        HIGH
    };

    int64_t timestamp_ms = 0;
    std::string summary;
    std::vector<std::string> objects;
    Severity threat_level = Severity::LOW;
    std::string detailed_log;
};

// Parses the JSON text returned by the analysis service, and stamps it 
// with `timestamp_ms`. Throws std::invalid_argument if the text is 
// malformed or misses a required field.
PAIRRTC_EXPORT AnalysisResult ParseAnalysisResult(const std::string& json_text, int64_t timestamp_ms);

PAIRRTC_EXPORT std::string ToString(AnalysisResult::Severity severity);
PAIRRTC_EXPORT AnalysisResult::Severity ToSeverity(const std::string& str);

PAIRRTC_EXPORT std::ostream& operator<<(std::ostream& out, AnalysisResult::Severity severity);

} // namespace pairrtc

#endif
