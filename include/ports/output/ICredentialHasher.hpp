#pragma once

#include <string>

namespace finger::ports::output {

/**
 * @brief Выдача и проверка секретных ключей
 */
class ICredentialHasher {
public:
    virtual ~ICredentialHasher() = default;

    /**
     * @brief Сгенерировать новый auth key (показывается пользователю один раз)
     */
    virtual std::string generateKey() = 0;

    /**
     * @brief Необратимый хэш ключа для хранения
     */
    virtual std::string hash(const std::string& key) const = 0;

    /**
     * @brief Сравнение за время, не зависящее от содержимого
     *
     * Строки разной длины тоже сравниваются без раннего выхода по данным.
     */
    virtual bool equals(const std::string& a, const std::string& b) const = 0;
};

} // namespace finger::ports::output
