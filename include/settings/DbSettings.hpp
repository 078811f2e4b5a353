#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace finger::settings {

/**
 * @brief Настройки подключения к PostgreSQL из ENV
 *
 * Используются только при FINGER_STORAGE=postgres.
 */
class DbSettings {
public:
    DbSettings() {
        host_ = getEnvOrDefault("FINGER_DB_HOST", "localhost");
        name_ = getEnvOrDefault("FINGER_DB_NAME", "finger_db");
        user_ = getEnvOrDefault("FINGER_DB_USER", "finger_user");
        password_ = getEnvOrDefault("FINGER_DB_PASSWORD", "");

        std::string port = getEnvOrDefault("FINGER_DB_PORT", "5432");
        try {
            port_ = std::stoi(port);
        } catch (const std::logic_error&) {
            throw std::runtime_error("FINGER_DB_PORT is not a number: " + port);
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }

    std::string getConnectionString() const {
        std::string conn = "host=" + host_ +
                           " port=" + std::to_string(port_) +
                           " dbname=" + name_ +
                           " user=" + user_;
        if (!password_.empty()) {
            conn += " password=" + password_;
        }
        return conn;
    }

private:
    std::string host_;
    int port_ = 5432;
    std::string name_;
    std::string user_;
    std::string password_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }
};

} // namespace finger::settings
