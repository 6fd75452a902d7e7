#include "rtc/sdp/sdp_defines.hpp"

#include <unordered_map>

namespace pairrtc {
namespace sdp {

std::string ToString(Type type) {
    switch (type) {
    case Type::OFFER:
        return "offer";
    case Type::ANSWER:
        return "answer";
    case Type::PRANSWER:
        return "pranswer";
    case Type::ROLLBACK:
        return "rollback";
    default:
        return "unspec";
    }
}

Type ToType(const std::string& type_string) {
    using type_map_t = std::unordered_map<std::string, Type>;
    static const type_map_t type_map = {
        {"unspec", Type::UNSPEC},
        {"offer", Type::OFFER},
        {"answer", Type::ANSWER},
        {"pranswer", Type::PRANSWER},
        {"rollback", Type::ROLLBACK}
    };
    auto it = type_map.find(type_string);
    return it != type_map.end() ? it->second : Type::UNSPEC;
}

std::string ToString(Direction direction) {
    switch (direction) {
    case Direction::INACTIVE:
        return "inactive";
    case Direction::SEND_ONLY:
        return "sendonly";
    case Direction::RECV_ONLY:
        return "recvonly";
    default:
        return "sendrecv";
    }
}

Direction ToDirection(const std::string& direction_string) {
    if (direction_string == "inactive") {
        return Direction::INACTIVE;
    } else if (direction_string == "sendonly") {
        return Direction::SEND_ONLY;
    } else if (direction_string == "recvonly") {
        return Direction::RECV_ONLY;
    }
    return Direction::SEND_RECV;
}

std::ostream& operator<<(std::ostream& out, Type type) {
    return out << ToString(type);
}

std::ostream& operator<<(std::ostream& out, Direction direction) {
    return out << ToString(direction);
}

} // namespace sdp
} // namespace pairrtc
