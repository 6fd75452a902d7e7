#include "rtc/media/media_stream.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace pairrtc {

// MediaStreamTrack
MediaStreamTrack::MediaStreamTrack(Kind kind, std::string id) 
    : kind_(kind),
      id_(std::move(id)),
      stopped_(false) {}

MediaStreamTrack::~MediaStreamTrack() = default;

void MediaStreamTrack::Stop() {
    if (!stopped_.exchange(true)) {
        PLOG_VERBOSE << "Stopped " << kind_ << " track: " << id_;
    }
}

// MediaStream
MediaStream::MediaStream(std::string id) 
    : id_(std::move(id)) {}

MediaStream::~MediaStream() = default;

bool MediaStream::HasAudio() const {
    return std::any_of(tracks_.begin(), tracks_.end(), [](const auto& track){
        return track->kind() == MediaStreamTrack::Kind::AUDIO;
    });
}

bool MediaStream::HasVideo() const {
    return std::any_of(tracks_.begin(), tracks_.end(), [](const auto& track){
        return track->kind() == MediaStreamTrack::Kind::VIDEO;
    });
}

bool MediaStream::stopped() const {
    return std::all_of(tracks_.begin(), tracks_.end(), [](const auto& track){
        return track->stopped();
    });
}

void MediaStream::AddTrack(std::shared_ptr<MediaStreamTrack> track) {
    if (track) {
        tracks_.push_back(std::move(track));
    }
}

void MediaStream::Stop() {
    for (auto& track : tracks_) {
        track->Stop();
    }
}

std::ostream& operator<<(std::ostream& out, MediaStreamTrack::Kind kind) {
    return out << (kind == MediaStreamTrack::Kind::AUDIO ? "audio" : "video");
}

} // namespace pairrtc
