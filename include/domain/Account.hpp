#pragma once

#include "domain/Timestamp.hpp"
#include <cstddef>
#include <string>

namespace finger::domain {

/**
 * @brief Учётная запись
 *
 * Создаётся один раз при регистрации и больше не меняется.
 * Сам ключ не хранится, только его SHA-256 (hex).
 */
struct Account {
    /// Совпадает с username VARCHAR(64) в db/init.sql
    static constexpr std::size_t MAX_USERNAME_LENGTH = 64;

    std::string username;   ///< Уникальное имя, регистр значим
    std::string keyHash;    ///< SHA-256 от auth key в hex
    Timestamp createdAt;    ///< Время регистрации

    Account() = default;

    Account(const std::string& username,
            const std::string& keyHash,
            Timestamp createdAt)
        : username(username)
        , keyHash(keyHash)
        , createdAt(createdAt)
    {}

    /**
     * @brief Непустое имя не длиннее MAX_USERNAME_LENGTH байт
     */
    static bool isValidUsername(const std::string& name) {
        return !name.empty() && name.size() <= MAX_USERNAME_LENGTH;
    }
};

} // namespace finger::domain
