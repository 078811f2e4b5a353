#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "domain/StoreUnavailableException.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>

namespace finger::adapters::secondary {

/**
 * @brief Учётные записи в JSON-файле
 *
 * Формат файла:
 * [
 *   {"username": "alice", "key_hash": "5e88...", "created_at": 1700000000000}
 * ]
 *
 * Файл читается один раз в конструкторе. Каждая регистрация
 * переписывает его целиком через временный файл и rename(),
 * так что на диске всегда лежит либо старая, либо новая версия.
 */
class JsonFileAccountRepository : public ports::output::IAccountRepository {
public:
    explicit JsonFileAccountRepository(const std::string& path)
        : path_(path)
    {
        load();
        std::cout << "[JsonFileAccountRepo] Loaded " << accounts_.size()
                  << " account(s) from " << path_ << std::endl;
    }

    bool create(const domain::Account& account) override {
        std::lock_guard<std::mutex> lock(mutex_);

        if (accounts_.count(account.username) > 0) {
            return false;
        }

        accounts_.emplace(account.username, account);
        try {
            flush();
        } catch (const domain::StoreUnavailableException&) {
            // На диск не попало, значит и в памяти регистрации нет
            accounts_.erase(account.username);
            throw;
        }
        return true;
    }

    std::optional<domain::Account> findByUsername(const std::string& username) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = accounts_.find(username);
        if (it == accounts_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    size_t count() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return accounts_.size();
    }

    const std::string& path() const { return path_; }

private:
    void load() {
        std::ifstream in(path_);
        if (!in.is_open()) {
            // Первый запуск: файла ещё нет
            return;
        }

        nlohmann::json data;
        try {
            in >> data;
        } catch (const nlohmann::json::exception& e) {
            throw domain::StoreUnavailableException("Corrupted accounts file " + path_ + ": " + e.what());
        }

        if (!data.is_array()) {
            throw domain::StoreUnavailableException("Accounts file " + path_ + " must contain a JSON array");
        }

        try {
            for (const auto& item : data) {
                domain::Account account(
                    item.at("username").get<std::string>(),
                    item.at("key_hash").get<std::string>(),
                    domain::Timestamp::fromMillis(item.value("created_at", int64_t{0}))
                );
                accounts_.emplace(account.username, account);
            }
        } catch (const nlohmann::json::exception& e) {
            throw domain::StoreUnavailableException("Invalid account record in " + path_ + ": " + e.what());
        }
    }

    void flush() const {
        nlohmann::json data = nlohmann::json::array();
        for (const auto& [username, account] : accounts_) {
            data.push_back({
                {"username", account.username},
                {"key_hash", account.keyHash},
                {"created_at", account.createdAt.toMillis()}
            });
        }

        const std::string tmpPath = path_ + ".tmp";
        {
            std::ofstream out(tmpPath, std::ios::trunc);
            if (!out.is_open()) {
                throw domain::StoreUnavailableException("Cannot open " + tmpPath + " for writing");
            }
            out << data.dump(2);
            out.flush();
            if (!out) {
                throw domain::StoreUnavailableException("Cannot write " + tmpPath);
            }
        }

        if (std::rename(tmpPath.c_str(), path_.c_str()) != 0) {
            std::remove(tmpPath.c_str());
            throw domain::StoreUnavailableException("Cannot replace " + path_);
        }
    }

    std::string path_;
    std::map<std::string, domain::Account> accounts_;
    mutable std::mutex mutex_;
};

} // namespace finger::adapters::secondary
