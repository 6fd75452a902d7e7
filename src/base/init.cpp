#include "base/init.hpp"

#include <plog/Log.h>

namespace pairrtc {

void Init(logging::Level level, logging::LoggingCallback callback) {
    logging::InitLogger(level, std::move(callback));
    PLOG_INFO << "pairrtc initialized.";
}

void Cleanup() {
    PLOG_INFO << "pairrtc cleaned up.";
    // Silence the logger, the appender might be released after this.
    logging::InitLogger(plog::Severity::none, nullptr);
}
    
} // namespace pairrtc
