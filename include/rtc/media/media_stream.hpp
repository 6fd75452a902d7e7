#ifndef _RTC_MEDIA_MEDIA_STREAM_H_
#define _RTC_MEDIA_MEDIA_STREAM_H_

#include "base/defines.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <iostream>

namespace pairrtc {

// MediaStreamTrack
class PAIRRTC_EXPORT MediaStreamTrack {
public:
    enum class Kind {
        AUDIO,
        VIDEO
    };
public:
    MediaStreamTrack(Kind kind, std::string id);
    ~MediaStreamTrack();

    Kind kind() const { return kind_; }
    const std::string& id() const { return id_; }
    bool stopped() const { return stopped_; }

    // Releases the underlying source, stopping twice has no effect.
    void Stop();

private:
    const Kind kind_;
    const std::string id_;
    std::atomic<bool> stopped_;
};

// MediaStream
class PAIRRTC_EXPORT MediaStream {
public:
    explicit MediaStream(std::string id);
    ~MediaStream();

    const std::string& id() const { return id_; }
    const std::vector<std::shared_ptr<MediaStreamTrack>>& tracks() const { return tracks_; }
    bool HasAudio() const;
    bool HasVideo() const;
    // Returns true if every track has been stopped.
    bool stopped() const;

    void AddTrack(std::shared_ptr<MediaStreamTrack> track);
    void Stop();

private:
    const std::string id_;
    std::vector<std::shared_ptr<MediaStreamTrack>> tracks_;
};

// Constraints of GetUserMedia
struct PAIRRTC_EXPORT MediaConstraints {
    bool audio = true;
    bool video = true;
};

PAIRRTC_EXPORT std::ostream& operator<<(std::ostream& out, MediaStreamTrack::Kind kind);

} // namespace pairrtc

#endif
