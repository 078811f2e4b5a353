#pragma once

#include <array>
#include <functional>
#include <mutex>
#include <string>

/**
 * @file KeyedMutex.hpp
 * @brief Полосатая (striped) блокировка по ключу
 *
 * Вместо одного глобального мьютекса держит фиксированный набор полос.
 * Ключ отображается на полосу по хэшу, поэтому операции над разными
 * ключами почти никогда не ждут друг друга, а над одним ключом
 * всегда сериализуются.
 *
 * @note Одновременно держать можно только одну полосу: две полосы,
 *       захваченные в разном порядке, дадут deadlock.
 */
template <size_t Stripes = 64>
class KeyedMutex
{
public:
    static_assert(Stripes > 0, "KeyedMutex needs at least one stripe");

    KeyedMutex() = default;

    KeyedMutex(const KeyedMutex &) = delete;
    KeyedMutex &operator=(const KeyedMutex &) = delete;

    /**
     * @brief Захватить полосу ключа на время жизни guard'а
     */
    std::unique_lock<std::mutex> lock(const std::string &key)
    {
        return std::unique_lock<std::mutex>(stripes_[stripeOf(key)]);
    }

    size_t stripeOf(const std::string &key) const
    {
        return std::hash<std::string>{}(key) % Stripes;
    }

    static constexpr size_t stripeCount() { return Stripes; }

private:
    std::array<std::mutex, Stripes> stripes_;
};
