#pragma once

#include "domain/Timestamp.hpp"

namespace finger::ports::output {

/**
 * @brief Источник текущего времени
 *
 * Вся логика истечения статусов получает время только отсюда,
 * в тестах подставляется ручной clock.
 */
class IClock {
public:
    virtual ~IClock() = default;
    virtual domain::Timestamp now() const = 0;
};

} // namespace finger::ports::output
