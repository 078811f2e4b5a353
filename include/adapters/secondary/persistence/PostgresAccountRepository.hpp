#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "domain/StoreUnavailableException.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>

namespace finger::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория учётных записей
 *
 * Таблица accounts (см. db/init.sql). Атомарность create
 * обеспечивает PRIMARY KEY + ON CONFLICT DO NOTHING.
 *
 * Ошибки БД превращаются в StoreUnavailableException; после разрыва
 * соединения следующий запрос переподключается.
 */
class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    explicit PostgresAccountRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresAccountRepo] Connecting to PostgreSQL..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresAccountRepo] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepo] Connection failed: " << e.what() << std::endl;
            throw domain::StoreUnavailableException(e.what());
        }
    }

    ~PostgresAccountRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    bool create(const domain::Account& account) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(connection());

            auto result = txn.exec_params(
                R"(
                    INSERT INTO accounts (username, key_hash, created_at)
                    VALUES ($1, $2, $3)
                    ON CONFLICT (username) DO NOTHING
                )",
                account.username,
                account.keyHash,
                account.createdAt.toMillis()
            );

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            fail("create", e);
        }
    }

    std::optional<domain::Account> findByUsername(const std::string& username) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(connection());

            auto result = txn.exec_params(
                "SELECT username, key_hash, created_at FROM accounts WHERE username = $1",
                username
            );

            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }

            const auto& row = result[0];
            return domain::Account(
                row["username"].as<std::string>(),
                row["key_hash"].as<std::string>(),
                domain::Timestamp::fromMillis(row["created_at"].as<int64_t>())
            );

        } catch (const std::exception& e) {
            fail("findByUsername", e);
        }
    }

    size_t count() override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(connection());
            auto result = txn.exec("SELECT COUNT(*) FROM accounts");
            txn.commit();
            return result[0][0].as<size_t>();

        } catch (const std::exception& e) {
            fail("count", e);
        }
    }

private:
    pqxx::connection& connection() {
        if (!connection_ || !connection_->is_open()) {
            std::cout << "[PostgresAccountRepo] Reconnecting..." << std::endl;
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
        }
        return *connection_;
    }

    [[noreturn]] void fail(const char* operation, const std::exception& e) {
        std::cerr << "[PostgresAccountRepo] " << operation << "() failed: " << e.what() << std::endl;
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
