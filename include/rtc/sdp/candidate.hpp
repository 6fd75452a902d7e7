#ifndef _RTC_SDP_CANDIDATE_H_
#define _RTC_SDP_CANDIDATE_H_

#include "base/defines.hpp"

#include <cstdint>
#include <string>
#include <optional>
#include <iostream>

namespace pairrtc {
namespace sdp {

class PAIRRTC_EXPORT Candidate {
public:
    enum class Type {
        UNKNOWN,
        HOST,
        SERVER_REFLEXIVE,
        PEER_REFLEXIVE,
        RELAYED
    };

    enum class TransportType {
        UNKNOWN,
        UDP,
        TCP_ACTIVE,
        TCP_PASSIVE,
        TCP_S_O,
        TCP_UNKNOWN
    };
public:
    // Throws std::invalid_argument if the candidate line is malformed.
    explicit Candidate(std::string candidate);
    Candidate(std::string candidate, std::string mid);
    Candidate(std::string candidate, std::string mid, int mline_index);
    ~Candidate();

    const std::string& foundation() const { return foundation_; }
    uint32_t component_id() const { return component_id_; }
    Type type() const { return type_; }
    TransportType transport_type() const { return transport_type_; }
    uint32_t priority() const { return priority_; }
    const std::string& hostname() const { return hostname_; }
    const std::string& server_port() const { return server_port_; }
    std::string mid() const;
    int mline_index() const { return mline_index_; }

    void HintMid(std::string mid);

    // "a=candidate:..."
    std::string sdp_line() const;
    // "candidate:..."
    operator std::string() const;

    bool operator==(const Candidate& other) const;
    bool operator!=(const Candidate& other) const;

private:
    void Parse(std::string candidate);

private:
    std::string foundation_;
    uint32_t component_id_;
    uint32_t priority_;
    std::string transport_type_str_;
    TransportType transport_type_;
    std::string hostname_;
    std::string server_port_;
    std::string type_str_;
    Type type_;
    std::string various_tail_;
    std::optional<std::string> mid_;
    int mline_index_ = 0;
};

PAIRRTC_EXPORT std::ostream& operator<<(std::ostream& out, const Candidate& candidate);
PAIRRTC_EXPORT std::ostream& operator<<(std::ostream& out, Candidate::Type type);

} // namespace sdp
} // namespace pairrtc

#endif
