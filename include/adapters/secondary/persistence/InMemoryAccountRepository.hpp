#pragma once

#include "ports/output/IAccountRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>

namespace finger::adapters::secondary {

/**
 * @brief In-memory реализация репозитория учётных записей
 *
 * Используется при FINGER_STORAGE=memory и в unit-тестах.
 */
class InMemoryAccountRepository : public ports::output::IAccountRepository {
public:
    bool create(const domain::Account& account) override {
        return accounts_.insertIfAbsent(account.username, std::make_shared<domain::Account>(account));
    }

    std::optional<domain::Account> findByUsername(const std::string& username) override {
        auto account = accounts_.find(username);
        return account ? std::optional<domain::Account>(*account) : std::nullopt;
    }

    size_t count() override {
        return accounts_.size();
    }

    void clear() {
        accounts_.clear();
    }

private:
    ThreadSafeMap<std::string, domain::Account> accounts_;
};

} // namespace finger::adapters::secondary
