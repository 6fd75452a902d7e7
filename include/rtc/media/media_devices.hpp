#ifndef _RTC_MEDIA_MEDIA_DEVICES_H_
#define _RTC_MEDIA_MEDIA_DEVICES_H_

#include "base/defines.hpp"
#include "rtc/media/media_stream.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>

namespace pairrtc {

// Thrown when the user or the platform denies access to the capture devices.
class PAIRRTC_EXPORT MediaAccessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// MediaDevices supplies live capture streams.
class PAIRRTC_EXPORT MediaDevices {
public:
    using SuccessCallback = std::function<void(std::shared_ptr<MediaStream>)>;
    using FailureCallback = std::function<void(std::exception_ptr)>;
public:
    virtual ~MediaDevices() = default;

    // The callbacks may be invoked on any thread, and exactly one 
    // of them is invoked.
    virtual void GetUserMedia(const MediaConstraints& constraints,
                              SuccessCallback on_success,
                              FailureCallback on_failure) = 0;
};

} // namespace pairrtc

#endif
