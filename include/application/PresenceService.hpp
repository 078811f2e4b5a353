#pragma once

#include "ports/input/IPresenceService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IPresenceRepository.hpp"
#include "ports/output/IVisibilityRepository.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/ICredentialHasher.hpp"
#include "application/AccountStore.hpp"
#include "application/PresenceStore.hpp"
#include "application/VisibilityLog.hpp"
#include "settings/PresenceSettings.hpp"
#include <KeyedMutex.hpp>
#include <memory>

namespace finger::application {

/**
 * @brief Сервис присутствия: регистрация, online-статус, finger и журнал проверок
 *
 * Единственный, кто пишет в хранилища. Операции над одним username
 * сериализуются полосой KeyedMutex, разные username друг друга не ждут.
 *
 * Жизненный цикл статуса:
 *   NeverLoggedIn --login--> Online --logoff / истечение--> Offline --login--> Online
 * bump и logoff вне Online возвращают NOT_ONLINE.
 */
class PresenceService : public ports::input::IPresenceService {
public:
    PresenceService(
        std::shared_ptr<settings::PresenceSettings> settings,
        std::shared_ptr<ports::output::IAccountRepository> accountRepo,
        std::shared_ptr<ports::output::IPresenceRepository> presenceRepo,
        std::shared_ptr<ports::output::IVisibilityRepository> visibilityRepo,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::ICredentialHasher> hasher
    );

    ports::input::RegisterResult registerUser(
        const std::string& username,
        const std::optional<std::string>& registrationKey
    ) override;

    ports::input::OperationResult login(
        const std::string& username,
        const std::string& key,
        const std::optional<std::string>& status
    ) override;

    ports::input::OperationResult logoff(const std::string& username, const std::string& key) override;

    ports::input::OperationResult bump(const std::string& username, const std::string& key) override;

    ports::input::FingerResult finger(
        const std::string& subject,
        const std::optional<ports::input::Credentials>& caller
    ) override;

    ports::input::ListResult list() override;

    ports::input::CheckResult check(const std::string& username, const std::string& key) override;

    size_t expireStale() override;

private:
    std::shared_ptr<settings::PresenceSettings> settings_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::ICredentialHasher> hasher_;

    AccountStore accounts_;
    PresenceStore presence_;
    VisibilityLog visibility_;
    KeyedMutex<> locks_;

    domain::PresenceView toView(
        const std::string& username,
        const std::optional<domain::PresenceStatus>& status,
        const domain::Timestamp& now
    ) const;
};

} // namespace finger::application
