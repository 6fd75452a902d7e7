#ifndef _COMMON_LOGGER_H_
#define _COMMON_LOGGER_H_

#include "base/defines.hpp"

#include <plog/Log.h>

#include <functional>
#include <string>

namespace pairrtc {
namespace logging {

enum class Level { // Don't change, it MUST match plog severity
    NONE = 0,
    FATAL = 1,
    ERROR = 2,
    WARNING = 3,
    INFO = 4,
    DEBUG = 5,
    VERBOSE = 6
};

// Returns true if the message was consumed, otherwise it is
// printed to stdout.
using LoggingCallback = std::function<bool(Level level, std::string message)>;

PAIRRTC_EXPORT void InitLogger(Level level, LoggingCallback callback = nullptr);
PAIRRTC_EXPORT void InitLogger(plog::Severity severity, plog::IAppender *appender = nullptr);

PAIRRTC_EXPORT Level LevelFromString(const std::string& level_string);

} // namespace logging
} // namespace pairrtc

#endif
