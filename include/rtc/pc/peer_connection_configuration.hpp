#ifndef _RTC_PC_PEER_CONNECTION_CONFIGURATION_H_
#define _RTC_PC_PEER_CONNECTION_CONFIGURATION_H_

#include "base/defines.hpp"

#include <string>
#include <vector>
#include <optional>

namespace pairrtc {

// IceServer
struct PAIRRTC_EXPORT IceServer {
    enum class Type { STUN, TURN };
    enum class RelayType { TURN_UDP, TURN_TCP, TURN_TLS };

    // Throws std::invalid_argument if the url is malformed.
    IceServer(const std::string& url);

    // STUN
    IceServer(std::string hostname, uint16_t port);

    // TURN
    IceServer(std::string hostname, uint16_t port, std::string username, std::string password, RelayType relay_type = RelayType::TURN_UDP);

    const std::string& hostname() const { return hostname_; }
    uint16_t port() const { return port_; }
    Type type() const { return type_; }
    RelayType relay_type() const { return relay_type_; }
    const std::string& username() const { return username_; }
    const std::string& password() const { return password_; }

    // e.g. stun:stun.l.google.com:19302
    std::string url() const;
    operator std::string() const;

private:
    std::string hostname_;
    uint16_t port_;
    Type type_;
    std::string username_;
    std::string password_;
    RelayType relay_type_;
};

// Rtc Configuration
struct PAIRRTC_EXPORT RtcConfiguration {
    // Ice settings
    std::vector<IceServer> ice_servers;

    bool enable_ice_tcp = false;

    // Port range
    uint16_t port_range_begin = 1024;
    uint16_t port_range_end = 65535;
};

} // namespace pairrtc

#endif
