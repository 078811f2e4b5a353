#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cstdint>

namespace finger::domain {

/**
 * @brief Временная метка
 *
 * Тонкая обёртка над system_clock::time_point. Текущее время сюда
 * никогда не подставляется неявно: его выдаёт только IClock.
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() = default;

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp fromSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::seconds(seconds)));
    }

    static Timestamp fromMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::milliseconds(millis)));
    }

    int64_t toSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(value.time_since_epoch()).count();
    }

    int64_t toMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
    }

    Timestamp plus(std::chrono::seconds duration) const {
        return Timestamp(value + duration);
    }

    /**
     * @brief Целые секунды от earlier до this (не меньше нуля)
     */
    int64_t secondsSince(const Timestamp& earlier) const {
        auto diff = std::chrono::duration_cast<std::chrono::seconds>(value - earlier.value).count();
        return diff > 0 ? diff : 0;
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm{};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
};

} // namespace finger::domain
