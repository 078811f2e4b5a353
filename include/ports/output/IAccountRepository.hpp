#pragma once

#include "domain/Account.hpp"
#include <string>
#include <optional>
#include <cstddef>

namespace finger::ports::output {

/**
 * @brief Интерфейс репозитория учётных записей
 *
 * Output Port. Реализации бросают domain::StoreUnavailableException,
 * если хранилище недоступно.
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    /**
     * @brief Атомарно создать учётную запись
     *
     * Проверка и вставка выполняются одной операцией: из двух
     * одновременных create с одним username успешен ровно один.
     *
     * @return true если создана, false если username уже занят
     */
    virtual bool create(const domain::Account& account) = 0;

    /**
     * @brief Найти учётную запись по username
     * @return Account или nullopt
     */
    virtual std::optional<domain::Account> findByUsername(const std::string& username) = 0;

    /**
     * @brief Количество зарегистрированных учётных записей
     */
    virtual size_t count() = 0;
};

} // namespace finger::ports::output
