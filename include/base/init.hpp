#ifndef _BASE_INIT_H_
#define _BASE_INIT_H_

#include "base/defines.hpp"
#include "common/logger.hpp"

namespace pairrtc {

PAIRRTC_EXPORT void Init(logging::Level level = logging::Level::NONE, 
                         logging::LoggingCallback callback = nullptr);
PAIRRTC_EXPORT void Cleanup();
    
} // namespace pairrtc

#endif
