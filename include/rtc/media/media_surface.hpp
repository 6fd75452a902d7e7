#ifndef _RTC_MEDIA_MEDIA_SURFACE_H_
#define _RTC_MEDIA_MEDIA_SURFACE_H_

#include "base/defines.hpp"
#include "rtc/media/media_stream.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace pairrtc {

// The render target of a participant, showing the local preview
// and the remote stream side by side.
class PAIRRTC_EXPORT MediaSurface {
public:
    enum class Slot {
        LOCAL,
        REMOTE
    };
public:
    virtual ~MediaSurface() = default;

    virtual void AttachLocalStream(std::shared_ptr<MediaStream> stream) = 0;
    virtual void AttachRemoteStream(std::shared_ptr<MediaStream> stream) = 0;
    virtual void Detach(Slot slot) = 0;
};

// StillImage
struct PAIRRTC_EXPORT StillImage {
    int width = 0;
    int height = 0;
    // Encoded as JPEG
    std::vector<uint8_t> data;
};

// FrameSource grabs still images from what a slot is rendering.
class PAIRRTC_EXPORT FrameSource {
public:
    virtual ~FrameSource() = default;

    // Returns std::nullopt if nothing is rendering in the slot.
    virtual std::optional<StillImage> CaptureStill(MediaSurface::Slot slot) = 0;
};

} // namespace pairrtc

#endif
