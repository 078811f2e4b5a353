#pragma once

#include "domain/PresenceStatus.hpp"
#include "domain/VisibilityEntry.hpp"
#include "domain/enums/PresenceError.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstddef>

namespace finger::ports::input {

/**
 * @brief Пара username + key от вызывающего
 */
struct Credentials {
    std::string username;
    std::string key;
};

/**
 * @brief Результат операции без полезной нагрузки (login, logoff, bump)
 */
struct OperationResult {
    bool success = false;
    domain::PresenceError error = domain::PresenceError::NONE;
    std::string message;
};

/**
 * @brief Результат регистрации
 */
struct RegisterResult {
    bool success = false;
    std::string authKey;    ///< Выдаётся один раз, повторно получить нельзя
    domain::PresenceError error = domain::PresenceError::NONE;
    std::string message;
};

/**
 * @brief Результат finger
 */
struct FingerResult {
    bool success = false;
    domain::PresenceView status;
    domain::PresenceError error = domain::PresenceError::NONE;
    std::string message;
};

/**
 * @brief Результат list: только те, кто сейчас online, по алфавиту
 */
struct ListResult {
    bool success = false;
    std::vector<domain::PresenceView> users;
    domain::PresenceError error = domain::PresenceError::NONE;
    std::string message;
};

/**
 * @brief Результат check: журнал проверок, от старых к новым
 */
struct CheckResult {
    bool success = false;
    std::vector<domain::VisibilityEntry> checkers;
    domain::PresenceError error = domain::PresenceError::NONE;
    std::string message;
};

/**
 * @brief Интерфейс сервиса присутствия
 *
 * Input Port. Все операции потокобезопасны.
 */
class IPresenceService {
public:
    virtual ~IPresenceService() = default;

    /**
     * @brief Зарегистрировать username
     * @param registrationKey Ключ регистрации, если сервер его требует
     */
    virtual RegisterResult registerUser(
        const std::string& username,
        const std::optional<std::string>& registrationKey
    ) = 0;

    /**
     * @brief Перейти в online на одно окно присутствия
     * @param status Новый текст статуса; nullopt оставляет прежний
     */
    virtual OperationResult login(
        const std::string& username,
        const std::string& key,
        const std::optional<std::string>& status
    ) = 0;

    virtual OperationResult logoff(const std::string& username, const std::string& key) = 0;

    /**
     * @brief Продлить окно присутствия от текущего момента
     */
    virtual OperationResult bump(const std::string& username, const std::string& key) = 0;

    /**
     * @brief Узнать статус subject
     * @param caller Учётные данные вызывающего; nullopt = анонимный запрос
     */
    virtual FingerResult finger(
        const std::string& subject,
        const std::optional<Credentials>& caller
    ) = 0;

    virtual ListResult list() = 0;

    virtual CheckResult check(const std::string& username, const std::string& key) = 0;

    /**
     * @brief Перевести в offline все истёкшие записи
     * @return Сколько записей переписано
     */
    virtual size_t expireStale() = 0;
};

} // namespace finger::ports::input
