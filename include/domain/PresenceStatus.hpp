#pragma once

#include "domain/Timestamp.hpp"
#include <string>

namespace finger::domain {

/**
 * @brief Хранимое состояние присутствия пользователя
 *
 * Создаётся лениво при первом login и никогда не удаляется.
 * Поле online отражает последнюю запись, а не текущий момент:
 * эффективный статус считается через isOnlineAt().
 */
struct PresenceStatus {
    std::string username;
    bool online = false;
    Timestamp expiresAt;    ///< Имеет смысл только при online == true
    std::string message;    ///< Текст статуса, переживает logoff
    Timestamp since;        ///< Момент последнего перехода online/offline

    bool isOnlineAt(const Timestamp& now) const {
        return online && now < expiresAt;
    }

    /**
     * @brief Статус, каким он виден в момент now
     *
     * Истёкшая запись превращается в offline, а since сдвигается
     * на момент истечения.
     */
    PresenceStatus effectiveAt(const Timestamp& now) const {
        PresenceStatus result = *this;
        if (online && !isOnlineAt(now)) {
            result.online = false;
            result.since = expiresAt;
        }
        return result;
    }
};

/**
 * @brief Статус, отдаваемый наружу (finger, list)
 */
struct PresenceView {
    std::string username;
    bool online = false;
    std::string message;
    int64_t sinceSeconds = 0;   ///< Сколько секунд прошло с последнего перехода
};

} // namespace finger::domain
