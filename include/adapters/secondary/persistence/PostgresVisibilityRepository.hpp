#pragma once

#include "ports/output/IVisibilityRepository.hpp"
#include "domain/StoreUnavailableException.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>

namespace finger::adapters::secondary {

/**
 * @brief PostgreSQL журнал проверок
 *
 * Порядок добавления задаёт BIGSERIAL id, а не время: у двух
 * записей может совпасть at.
 */
class PostgresVisibilityRepository : public ports::output::IVisibilityRepository {
public:
    explicit PostgresVisibilityRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresVisibilityRepo] Connecting to PostgreSQL..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresVisibilityRepo] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresVisibilityRepo] Connection failed: " << e.what() << std::endl;
            throw domain::StoreUnavailableException(e.what());
        }
    }

    ~PostgresVisibilityRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    void append(const domain::VisibilityEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(connection());

            txn.exec_params(
                "INSERT INTO visibility_log (subject, observer, at) VALUES ($1, $2, $3)",
                entry.subject,
                entry.observer,
                entry.at.toMillis()
            );

            txn.commit();

        } catch (const std::exception& e) {
            fail("append", e);
        }
    }

    std::vector<domain::VisibilityEntry> findBySubject(const std::string& username) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(connection());

            auto result = txn.exec_params(
                "SELECT observer, subject, at FROM visibility_log WHERE subject = $1 ORDER BY id",
                username
            );

            txn.commit();

            std::vector<domain::VisibilityEntry> entries;
            for (const auto& row : result) {
                entries.emplace_back(
                    row["observer"].as<std::string>(),
                    row["subject"].as<std::string>(),
                    domain::Timestamp::fromMillis(row["at"].as<int64_t>())
                );
            }
            return entries;

        } catch (const std::exception& e) {
            fail("findBySubject", e);
        }
    }

private:
    pqxx::connection& connection() {
        if (!connection_ || !connection_->is_open()) {
            std::cout << "[PostgresVisibilityRepo] Reconnecting..." << std::endl;
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
        }
        return *connection_;
    }

    [[noreturn]] void fail(const char* operation, const std::exception& e) {
        std::cerr << "[PostgresVisibilityRepo] " << operation << "() failed: " << e.what() << std::endl;
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
