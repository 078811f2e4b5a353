#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "ports/output/ICredentialHasher.hpp"
#include "domain/Account.hpp"
#include <memory>
#include <optional>
#include <string>

namespace finger::application {

/**
 * @brief Учётные записи и проверка ключей
 *
 * verify() не различает "нет такого пользователя" и "неверный ключ":
 * в обоих случаях хэшируется переданный ключ и выполняется одно
 * сравнение фиксированной длины.
 */
class AccountStore {
public:
    AccountStore(
        std::shared_ptr<ports::output::IAccountRepository> repository,
        std::shared_ptr<ports::output::ICredentialHasher> hasher
    ) : repository_(std::move(repository))
      , hasher_(std::move(hasher))
      , dummyHash_(hasher_->hash("finger-service/unknown-user"))
    {}

    /**
     * @brief Создать учётную запись с уже выданным ключом
     * @return Account или nullopt, если username занят
     */
    std::optional<domain::Account> create(
        const std::string& username,
        const std::string& authKey,
        const domain::Timestamp& now
    ) {
        domain::Account account(username, hasher_->hash(authKey), now);
        if (!repository_->create(account)) {
            return std::nullopt;
        }
        return account;
    }

    std::optional<domain::Account> lookup(const std::string& username) {
        return repository_->findByUsername(username);
    }

    bool verify(const std::string& username, const std::string& suppliedKey) {
        auto account = repository_->findByUsername(username);
        const std::string suppliedHash = hasher_->hash(suppliedKey);
        const std::string& expected = account ? account->keyHash : dummyHash_;
        bool matches = hasher_->equals(suppliedHash, expected);
        return account.has_value() && matches;
    }

    size_t count() {
        return repository_->count();
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> repository_;
    std::shared_ptr<ports::output::ICredentialHasher> hasher_;
    std::string dummyHash_;
};

} // namespace finger::application
