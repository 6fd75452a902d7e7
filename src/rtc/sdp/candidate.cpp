#include "rtc/sdp/candidate.hpp"
#include "common/utils_string.hpp"

#include <plog/Log.h>

#include <unordered_map>
#include <array>
#include <sstream>

namespace pairrtc {
namespace sdp {

Candidate::Candidate(std::string candidate) 
    : foundation_("none"),
      component_id_(0),
      priority_(0),
      transport_type_(TransportType::UNKNOWN),
      hostname_("0.0.0.0"),
      server_port_("9"),
      type_(Type::UNKNOWN) {
    Parse(std::move(candidate));
}

Candidate::Candidate(std::string candidate, std::string mid) 
    : Candidate(std::move(candidate)) {
    HintMid(std::move(mid));
}

Candidate::Candidate(std::string candidate, std::string mid, int mline_index) 
    : Candidate(std::move(candidate), std::move(mid)) {
    mline_index_ = mline_index;
}

Candidate::~Candidate() = default;

std::string Candidate::mid() const {
    return mid_.value_or("0");
}

void Candidate::HintMid(std::string mid) {
    if (!mid.empty()) {
        mid_.emplace(std::move(mid));
    }
}

std::string Candidate::sdp_line() const {
    return "a=" + std::string(*this);
}

Candidate::operator std::string() const {
    const char sp{' '};
    std::ostringstream oss;
    oss << "candidate:";
    oss << foundation_ << sp << component_id_ << sp << transport_type_str_ << sp << priority_ << sp;
    oss << hostname_ << sp << server_port_;
    oss << sp << "typ" << sp << type_str_;
    if (!various_tail_.empty()) {
        oss << sp << various_tail_;
    }
    return oss.str();
}

bool Candidate::operator==(const Candidate& other) const {
    return foundation_ == other.foundation_ &&
           component_id_ == other.component_id_ &&
           transport_type_ == other.transport_type_ &&
           hostname_ == other.hostname_ &&
           server_port_ == other.server_port_ &&
           mid() == other.mid();
}

bool Candidate::operator!=(const Candidate& other) const {
    return !(*this == other);
}

// Private Methods
void Candidate::Parse(std::string candidate) {
    using candidate_type_map_t = std::unordered_map<std::string, Type>;
    using tcp_transport_type_map_t = std::unordered_map<std::string, TransportType>;

    static const candidate_type_map_t candidate_type_map = {
        {"host", Type::HOST},
        {"srflx", Type::SERVER_REFLEXIVE},
        {"prflx", Type::PEER_REFLEXIVE},
        {"relay", Type::RELAYED}
    };

    static const tcp_transport_type_map_t tcp_trans_type_map = {
        {"active", TransportType::TCP_ACTIVE},
        {"passive", TransportType::TCP_PASSIVE},
        {"so", TransportType::TCP_S_O}
    };

    const std::array<std::string, 2> prefixes = {"a=", "candidate:"};
    for (std::string_view prefix : prefixes) {
        if (utils::string::match_prefix(candidate, prefix)) {
            candidate.erase(0, prefix.size());
        }
    }
    
    PLOG_VERBOSE << "Parsing candidate: " << candidate;

    // e.g. "1 1 UDP 9654321 212.223.223.223 12345 typ srflx raddr 10.216.33.9 rport 54321"
    std::istringstream iss(candidate);
    std::string type_indicator;
    if (!(iss >> foundation_ >> component_id_ >> transport_type_str_ >> priority_ 
              >> hostname_ >> server_port_ >> type_indicator >> type_str_) || type_indicator != "typ") {
        throw std::invalid_argument("Invalid candidate format: " + candidate);
    }

    auto it = candidate_type_map.find(type_str_);
    type_ = it != candidate_type_map.end() ? it->second : Type::UNKNOWN;

    // Keep a copy of the parameters after 'typ', like raddr, generation and network-cost.
    std::getline(iss, various_tail_);
    utils::string::trim_begin(various_tail_);
    utils::string::trim_end(various_tail_);

    if (transport_type_str_ == "UDP" || transport_type_str_ == "udp") {
        transport_type_ = TransportType::UDP;
    } else if (transport_type_str_ == "TCP" || transport_type_str_ == "tcp") {
        std::istringstream tail(various_tail_);
        std::string key, value;
        transport_type_ = TransportType::TCP_UNKNOWN;
        while (tail >> key >> value) {
            if (key == "tcptype") {
                auto tcp_it = tcp_trans_type_map.find(value);
                if (tcp_it != tcp_trans_type_map.end()) {
                    transport_type_ = tcp_it->second;
                }
                break;
            }
        }
    } else {
        transport_type_ = TransportType::UNKNOWN;
    }
}

std::ostream& operator<<(std::ostream& out, const Candidate& candidate) {
    return out << std::string(candidate);
}

std::ostream& operator<<(std::ostream& out, Candidate::Type type) {
    switch(type) {
    case Candidate::Type::HOST:
        return out << "host";
    case Candidate::Type::PEER_REFLEXIVE:
        return out << "prflx";
    case Candidate::Type::SERVER_REFLEXIVE:
        return out << "srflx";
    case Candidate::Type::RELAYED:
        return out << "relay";
    default:
        return out << "unknown";
    }
}

} // namespace sdp
} // namespace pairrtc
