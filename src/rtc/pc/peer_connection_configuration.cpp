#include "rtc/pc/peer_connection_configuration.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <regex>
#include <sstream>

namespace pairrtc {
namespace {

std::optional<uint16_t> ParsePort(const std::string& service) {
    try {
        unsigned long port = std::stoul(service);
        if (port > 0 && port <= 65535) {
            return static_cast<uint16_t>(port);
        }
    } catch (const std::exception& exp) {
        PLOG_VERBOSE << "Failed to parse port: " << service << ", reason: " << exp.what();
    }
    return std::nullopt;
}

const char* RelayTypeToString(IceServer::RelayType relay_type) {
    switch (relay_type) {
    case IceServer::RelayType::TURN_TCP:
        return "tcp";
    case IceServer::RelayType::TURN_TLS:
        return "tls";
    default:
        return "udp";
    }
}

} // namespace

// eg: stun:stun.l.google.com:19302
// eg: turn:user:pass@192.158.29.39:3478?transport=udp
IceServer::IceServer(const std::string& url_string) {
    // Modified regex from RFC 3986, see https://tools.ietf.org/html/rfc3986#appendix-B
    static const char *rs =
        R"(^(([^:.@/?#]+):)?(/{0,2}((([^:@]*)(:([^@]*))?)@)?(([^:/?#]*)(:([^/?#]*))?))?([^?#]*)(\?([^#]*))?(#(.*))?)";
    static const std::regex r(rs, std::regex::extended);

    std::smatch m;
    if (!std::regex_match(url_string, m, r) || m[10].length() == 0) {
        throw std::invalid_argument("Invalid Ice server url: " + url_string);
    }

    std::vector<std::optional<std::string>> components(m.size());
    std::transform(m.begin(), m.end(), components.begin(), [](const auto &component) {
        return component.length() > 0 ? std::make_optional(std::string(component)) : std::nullopt;
    });

    std::string scheme = components[2].value_or("stun");
    relay_type_ = RelayType::TURN_UDP;
    if (scheme == "stun" || scheme == "STUN") {
        type_ = Type::STUN;
    } else if (scheme == "turn" || scheme == "TURN") {
        type_ = Type::TURN;
    } else if (scheme == "turns" || scheme == "TURNS") {
        type_ = Type::TURN;
        relay_type_ = RelayType::TURN_TLS;
    } else {
        throw std::invalid_argument("Unknown Ice Server protocol: " + scheme);
    }

    if (auto &query = components[15]) {
        if (query->find("transport=udp") != std::string::npos) {
            relay_type_ = RelayType::TURN_UDP;
        } else if (query->find("transport=tcp") != std::string::npos) {
            relay_type_ = RelayType::TURN_TCP;
        } else if (query->find("transport=tls") != std::string::npos) {
            relay_type_ = RelayType::TURN_TLS;
        }
    }

    username_ = components[6].value_or("");
    password_ = components[8].value_or("");

    hostname_ = components[10].value();
    while (!hostname_.empty() && hostname_.front() == '[') {
        hostname_.erase(hostname_.begin());
    }
    while (!hostname_.empty() && hostname_.back() == ']') {
        hostname_.pop_back();
    }

    std::string service = components[12].value_or(relay_type_ == RelayType::TURN_TLS ? "5349" : "3478");
    if (auto port = ParsePort(service)) {
        port_ = *port;
    } else {
        throw std::invalid_argument("Invalid ICE server port in URL: " + service);
    }
}

IceServer::IceServer(std::string hostname, uint16_t port) 
    : hostname_(std::move(hostname)), 
      port_(port), 
      type_(Type::STUN), 
      relay_type_(RelayType::TURN_UDP) {}

IceServer::IceServer(std::string hostname, uint16_t port, std::string username, std::string password, RelayType relay_type) 
    : hostname_(std::move(hostname)), 
      port_(port), 
      type_(Type::TURN), 
      username_(std::move(username)), 
      password_(std::move(password)), 
      relay_type_(relay_type) {}

std::string IceServer::url() const {
    std::ostringstream oss;
    if (type_ == Type::STUN) {
        oss << "stun:" << hostname_ << ":" << port_;
    } else {
        oss << (relay_type_ == RelayType::TURN_TLS ? "turns:" : "turn:");
        if (!username_.empty()) {
            oss << username_ << ":" << password_ << "@";
        }
        oss << hostname_ << ":" << port_ << "?transport=" << RelayTypeToString(relay_type_);
    }
    return oss.str();
}

IceServer::operator std::string() const {
    std::ostringstream desc;
    desc << "hostname: " << hostname_ << " port: " << port_ << " type: " << (type_ == Type::STUN ? "STUN" : "TURN");
    if (type_ == Type::TURN) {
        desc << " username: " << username_ << " relayType: " << RelayTypeToString(relay_type_);
    }
    return desc.str();
}

} // namespace pairrtc
