#ifndef _ANALYSIS_FRAME_ANALYSIS_SERVICE_H_
#define _ANALYSIS_FRAME_ANALYSIS_SERVICE_H_

#include "base/defines.hpp"
#include "rtc/media/media_surface.hpp"

#include <exception>
#include <functional>
#include <string>
#include <vector>

namespace pairrtc {

// FrameAnalysisService describes a short burst of still images.
class PAIRRTC_EXPORT FrameAnalysisService {
public:
    // The JSON text of `{summary, objects, threatLevel, detailedLog}`
    using SuccessCallback = std::function<void(std::string json_text)>;
    using FailureCallback = std::function<void(std::exception_ptr)>;
public:
    virtual ~FrameAnalysisService() = default;

    // The callbacks may be invoked on any thread.
    virtual void Analyze(std::vector<StillImage> frames, 
                         SuccessCallback on_success, 
                         FailureCallback on_failure) = 0;
};

} // namespace pairrtc

#endif
