#ifndef _SESSION_SESSION_ERROR_H_
#define _SESSION_SESSION_ERROR_H_

#include "base/defines.hpp"

#include <string>
#include <iostream>

namespace pairrtc {

// SessionError is the user-visible failure surfaced by a session.
struct PAIRRTC_EXPORT SessionError {
    enum class Kind {
        // Capture devices refused or unavailable, the role reverts to idle.
        LOCAL_MEDIA_DENIED,
        // A remote description was rejected, the negotiation keeps waiting.
        SIGNALING,
        // The transport failed, disconnected or timed out.
        TRANSPORT,
        // The frame analysis failed, the user may try again.
        ANALYSIS
    };

    Kind kind;
    std::string message;

    bool operator==(const SessionError& other) const {
        return kind == other.kind && message == other.message;
    }
};

constexpr char kLocalMediaDeniedMessage[] = "Camera access failed. Check permissions.";
constexpr char kRemoteDescriptionRejectedMessage[] = "The remote participant sent an invalid session description.";
constexpr char kTransportFailedMessage[] = "Connection to the remote participant was lost.";
constexpr char kAnalysisFailedMessage[] = "AI analysis failed. Please ensure your API key is valid and try again.";
constexpr char kAnalysisNotLiveMessage[] = "Analysis requires a live connection.";

PAIRRTC_EXPORT std::ostream& operator<<(std::ostream& out, SessionError::Kind kind);
PAIRRTC_EXPORT std::ostream& operator<<(std::ostream& out, const SessionError& error);

} // namespace pairrtc

#endif
