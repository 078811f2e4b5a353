#pragma once

#include <string>

namespace finger::domain {

enum class PresenceError {
    NONE,
    INVALID_USERNAME,
    USERNAME_TAKEN,
    REGISTRATION_CLOSED,
    INVALID_REGISTRATION_KEY,
    AUTH_FAILED,
    NOT_ONLINE,
    USER_NOT_FOUND,
    STORE_UNAVAILABLE
};

inline std::string toString(PresenceError error) {
    switch (error) {
        case PresenceError::NONE: return "NONE";
        case PresenceError::INVALID_USERNAME: return "INVALID_USERNAME";
        case PresenceError::USERNAME_TAKEN: return "USERNAME_TAKEN";
        case PresenceError::REGISTRATION_CLOSED: return "REGISTRATION_CLOSED";
        case PresenceError::INVALID_REGISTRATION_KEY: return "INVALID_REGISTRATION_KEY";
        case PresenceError::AUTH_FAILED: return "AUTH_FAILED";
        case PresenceError::NOT_ONLINE: return "NOT_ONLINE";
        case PresenceError::USER_NOT_FOUND: return "USER_NOT_FOUND";
        case PresenceError::STORE_UNAVAILABLE: return "STORE_UNAVAILABLE";
        default: return "UNKNOWN";
    }
}

inline PresenceError parsePresenceError(const std::string& str) {
    if (str == "INVALID_USERNAME") return PresenceError::INVALID_USERNAME;
    if (str == "USERNAME_TAKEN") return PresenceError::USERNAME_TAKEN;
    if (str == "REGISTRATION_CLOSED") return PresenceError::REGISTRATION_CLOSED;
    if (str == "INVALID_REGISTRATION_KEY") return PresenceError::INVALID_REGISTRATION_KEY;
    if (str == "AUTH_FAILED") return PresenceError::AUTH_FAILED;
    if (str == "NOT_ONLINE") return PresenceError::NOT_ONLINE;
    if (str == "USER_NOT_FOUND") return PresenceError::USER_NOT_FOUND;
    if (str == "STORE_UNAVAILABLE") return PresenceError::STORE_UNAVAILABLE;
    return PresenceError::NONE;
}

} // namespace finger::domain
