#pragma once

#include <string>
#include <optional>

namespace finger::domain {

enum class RegistrationMode {
    OPEN,
    KEY_REQUIRED,
    CLOSED
};

inline std::string toString(RegistrationMode mode) {
    switch (mode) {
        case RegistrationMode::OPEN: return "open";
        case RegistrationMode::KEY_REQUIRED: return "key";
        case RegistrationMode::CLOSED: return "closed";
        default: return "unknown";
    }
}

inline std::optional<RegistrationMode> parseRegistrationMode(const std::string& str) {
    if (str == "open") return RegistrationMode::OPEN;
    if (str == "key") return RegistrationMode::KEY_REQUIRED;
    if (str == "closed") return RegistrationMode::CLOSED;
    return std::nullopt;
}

} // namespace finger::domain
