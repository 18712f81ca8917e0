#include "conduit/types.hpp"

namespace conduit {

const char* sendModeToString(SendMode mode) {
    switch (mode) {
        case SendMode::TIME_SENSITIVE: return "TIME_SENSITIVE";
        case SendMode::UNRELIABLE:     return "UNRELIABLE";
        case SendMode::PERSISTENT:     return "PERSISTENT";
        case SendMode::RELIABLE:       return "RELIABLE";
        default:                       return "UNKNOWN";
    }
}

const char* eventTypeToString(EventType type) {
    switch (type) {
        case EventType::CONNECT:    return "CONNECT";
        case EventType::DISCONNECT: return "DISCONNECT";
        case EventType::RECEIVE:    return "RECEIVE";
        case EventType::TIMEOUT:    return "TIMEOUT";
        default:                    return "UNKNOWN";
    }
}

} // namespace conduit
