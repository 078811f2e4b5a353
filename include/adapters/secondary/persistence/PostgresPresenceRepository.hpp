#pragma once

#include "ports/output/IPresenceRepository.hpp"
#include "domain/StoreUnavailableException.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>

namespace finger::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория статусов
 *
 * Таблица presence, время хранится как epoch milliseconds (BIGINT).
 */
class PostgresPresenceRepository : public ports::output::IPresenceRepository {
public:
    explicit PostgresPresenceRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresPresenceRepo] Connecting to PostgreSQL..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresPresenceRepo] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresPresenceRepo] Connection failed: " << e.what() << std::endl;
            throw domain::StoreUnavailableException(e.what());
        }
    }

    ~PostgresPresenceRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<domain::PresenceStatus> find(const std::string& username) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(connection());

            auto result = txn.exec_params(
                R"(SELECT username, online, expires_at, message, since
                   FROM presence WHERE username = $1)",
                username
            );

            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }
            return rowToStatus(result[0]);

        } catch (const std::exception& e) {
            fail("find", e);
        }
    }

    void save(const domain::PresenceStatus& status) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(connection());

            txn.exec_params(
                R"(
                    INSERT INTO presence (username, online, expires_at, message, since)
                    VALUES ($1, $2, $3, $4, $5)
                    ON CONFLICT (username) DO UPDATE SET
                        online = EXCLUDED.online,
                        expires_at = EXCLUDED.expires_at,
                        message = EXCLUDED.message,
                        since = EXCLUDED.since
                )",
                status.username,
                status.online,
                status.expiresAt.toMillis(),
                status.message,
                status.since.toMillis()
            );

            txn.commit();

        } catch (const std::exception& e) {
            fail("save", e);
        }
    }

    std::vector<domain::PresenceStatus> findAll() override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(connection());
            auto result = txn.exec("SELECT username, online, expires_at, message, since FROM presence");
            txn.commit();

            std::vector<domain::PresenceStatus> statuses;
            for (const auto& row : result) {
                statuses.push_back(rowToStatus(row));
            }
            return statuses;

        } catch (const std::exception& e) {
            fail("findAll", e);
        }
    }

private:
    static domain::PresenceStatus rowToStatus(const pqxx::row& row) {
        domain::PresenceStatus status;
        status.username = row["username"].as<std::string>();
        status.online = row["online"].as<bool>();
        status.expiresAt = domain::Timestamp::fromMillis(row["expires_at"].as<int64_t>());
        status.message = row["message"].as<std::string>();
        status.since = domain::Timestamp::fromMillis(row["since"].as<int64_t>());
        return status;
    }

    pqxx::connection& connection() {
        if (!connection_ || !connection_->is_open()) {
            std::cout << "[PostgresPresenceRepo] Reconnecting..." << std::endl;
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
        }
        return *connection_;
    }

    [[noreturn]] void fail(const char* operation, const std::exception& e) {
        std::cerr << "[PostgresPresenceRepo] " << operation << "() failed: " << e.what() << std::endl;
        if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
            connection_.reset();
        }
        throw domain::StoreUnavailableException(e.what());
    }

    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

} // namespace finger::adapters::secondary
