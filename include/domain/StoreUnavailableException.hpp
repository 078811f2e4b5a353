#pragma once

#include <stdexcept>
#include <string>

namespace finger::domain {

/**
 * @brief Хранилище недоступно (упала БД, не пишется файл)
 *
 * Бросается адаптерами хранилищ. Фатально для запроса, но не для процесса.
 */
class StoreUnavailableException : public std::runtime_error {
public:
    explicit StoreUnavailableException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace finger::domain
