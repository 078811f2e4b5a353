#pragma once

#include "domain/VisibilityEntry.hpp"
#include <string>
#include <vector>

namespace finger::ports::output {

/**
 * @brief Интерфейс журнала проверок (append-only)
 */
class IVisibilityRepository {
public:
    virtual ~IVisibilityRepository() = default;

    virtual void append(const domain::VisibilityEntry& entry) = 0;

    /**
     * @brief Все записи, где subject == username, в порядке добавления
     */
    virtual std::vector<domain::VisibilityEntry> findBySubject(const std::string& username) = 0;
};

} // namespace finger::ports::output
