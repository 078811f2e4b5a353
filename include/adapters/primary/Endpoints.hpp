#pragma once

#include <array>
#include <string_view>

namespace finger::adapters::primary::endpoints {

/**
 * @brief Пути GET-endpoint'ов сервиса
 *
 * Один список для регистрации хэндлеров, баннера при старте и /health.
 */
inline constexpr std::string_view REGISTER = "/register";
inline constexpr std::string_view LOGIN    = "/login";
inline constexpr std::string_view LOGOFF   = "/logoff";
inline constexpr std::string_view BUMP     = "/bump";
inline constexpr std::string_view FINGER   = "/finger";
inline constexpr std::string_view LIST     = "/list";
inline constexpr std::string_view CHECK    = "/check";
inline constexpr std::string_view HEALTH   = "/health";
inline constexpr std::string_view METRICS  = "/metrics";

inline constexpr std::array<std::string_view, 9> ALL = {
    REGISTER, LOGIN, LOGOFF, BUMP, FINGER, LIST, CHECK, HEALTH, METRICS
};

} // namespace finger::adapters::primary::endpoints
