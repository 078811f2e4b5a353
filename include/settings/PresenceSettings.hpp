#pragma once

#include "domain/enums/RegistrationMode.hpp"
#include <string>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <iostream>

namespace finger::settings {

/**
 * @brief Настройки сервиса присутствия из ENV
 *
 * FINGER_REGISTRATION      open | key | closed        (default: open)
 * FINGER_REGISTRATION_KEY  ключ регистрации           (обязателен для key)
 * FINGER_PRESENCE_TTL      окно присутствия, секунды  (default: 3600)
 * FINGER_SWEEP_INTERVAL    период фоновой чистки, 0 = выкл (default: 60)
 * FINGER_STORAGE           memory | file | postgres   (default: memory)
 * FINGER_USERS_FILE        файл аккаунтов для file    (default: users.json)
 */
class PresenceSettings {
public:
    /// Потолок для TTL и периода чистки: 10 лет. Дальше now + ttl
    /// переполняет system_clock::time_point.
    static constexpr std::chrono::seconds MAX_DURATION{10LL * 365 * 24 * 3600};

    PresenceSettings() {
        auto mode = domain::parseRegistrationMode(getEnvOrDefault("FINGER_REGISTRATION", "open"));
        if (!mode) {
            throw std::runtime_error("FINGER_REGISTRATION must be one of: open, key, closed");
        }
        registrationMode_ = *mode;
        registrationKey_ = getEnvOrDefault("FINGER_REGISTRATION_KEY", "");
        presenceTtl_ = std::chrono::seconds(parseSeconds("FINGER_PRESENCE_TTL", "3600"));
        sweepInterval_ = std::chrono::seconds(parseSeconds("FINGER_SWEEP_INTERVAL", "60"));
        storage_ = getEnvOrDefault("FINGER_STORAGE", "memory");
        usersFile_ = getEnvOrDefault("FINGER_USERS_FILE", "users.json");

        validate();
    }

    PresenceSettings(domain::RegistrationMode mode,
                     std::string registrationKey,
                     std::chrono::seconds presenceTtl = std::chrono::seconds(3600),
                     std::chrono::seconds sweepInterval = std::chrono::seconds(60))
        : registrationMode_(mode)
        , registrationKey_(std::move(registrationKey))
        , presenceTtl_(presenceTtl)
        , sweepInterval_(sweepInterval)
        , storage_("memory")
        , usersFile_("users.json")
    {
        validate();
    }

    domain::RegistrationMode getRegistrationMode() const { return registrationMode_; }
    std::string getRegistrationKey() const { return registrationKey_; }
    std::chrono::seconds getPresenceTtl() const { return presenceTtl_; }
    std::chrono::seconds getSweepInterval() const { return sweepInterval_; }
    std::string getStorage() const { return storage_; }
    std::string getUsersFile() const { return usersFile_; }

private:
    domain::RegistrationMode registrationMode_;
    std::string registrationKey_;
    std::chrono::seconds presenceTtl_;
    std::chrono::seconds sweepInterval_;
    std::string storage_;
    std::string usersFile_;

    void validate() const {
        if (presenceTtl_.count() <= 0) {
            throw std::runtime_error("FINGER_PRESENCE_TTL must be positive");
        }
        if (presenceTtl_ > MAX_DURATION) {
            throw std::runtime_error("FINGER_PRESENCE_TTL must not exceed "
                                     + std::to_string(MAX_DURATION.count()) + " seconds");
        }
        if (sweepInterval_.count() < 0) {
            throw std::runtime_error("FINGER_SWEEP_INTERVAL must not be negative");
        }
        if (sweepInterval_ > MAX_DURATION) {
            throw std::runtime_error("FINGER_SWEEP_INTERVAL must not exceed "
                                     + std::to_string(MAX_DURATION.count()) + " seconds");
        }
        if (registrationMode_ == domain::RegistrationMode::KEY_REQUIRED && registrationKey_.empty()) {
            throw std::runtime_error("FINGER_REGISTRATION=key requires FINGER_REGISTRATION_KEY");
        }
        if (storage_ != "memory" && storage_ != "file" && storage_ != "postgres") {
            throw std::runtime_error("FINGER_STORAGE must be one of: memory, file, postgres");
        }
        if (registrationMode_ == domain::RegistrationMode::OPEN) {
            std::cout << "[PresenceSettings] WARNING: registration is open, anybody can register" << std::endl;
        }
    }

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    static long long parseSeconds(const char* name, const std::string& defaultValue) {
        std::string raw = getEnvOrDefault(name, defaultValue);
        try {
            size_t pos = 0;
            long long value = std::stoll(raw, &pos);
            if (pos != raw.size()) {
                throw std::invalid_argument(raw);
            }
            return value;
        } catch (const std::logic_error&) {
            throw std::runtime_error(std::string(name) + " is not a number: " + raw);
        }
    }
};

} // namespace finger::settings
