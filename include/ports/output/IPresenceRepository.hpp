#pragma once

#include "domain/PresenceStatus.hpp"
#include <string>
#include <optional>
#include <vector>

namespace finger::ports::output {

/**
 * @brief Интерфейс репозитория статусов присутствия
 *
 * Хранит записи как есть, без учёта времени: истечение считает
 * PresenceStore. Запись по одному username сериализует вызывающий.
 */
class IPresenceRepository {
public:
    virtual ~IPresenceRepository() = default;

    virtual std::optional<domain::PresenceStatus> find(const std::string& username) = 0;

    /**
     * @brief Создать или перезаписать запись username
     */
    virtual void save(const domain::PresenceStatus& status) = 0;

    /**
     * @brief Снимок всех записей
     */
    virtual std::vector<domain::PresenceStatus> findAll() = 0;
};

} // namespace finger::ports::output
