#pragma once

#include "domain/Timestamp.hpp"
#include <string>

namespace finger::domain {

/**
 * @brief Запись журнала "кто меня проверял"
 *
 * Пишется только при аутентифицированном finger, никогда не изменяется.
 */
struct VisibilityEntry {
    std::string observer;   ///< Кто выполнил finger
    std::string subject;    ///< Кого проверяли
    Timestamp at;           ///< Когда

    VisibilityEntry() = default;

    VisibilityEntry(const std::string& observer, const std::string& subject, Timestamp at)
        : observer(observer), subject(subject), at(at) {}
};

} // namespace finger::domain
