#include "application/PresenceService.hpp"
#include "domain/Account.hpp"
#include "domain/StoreUnavailableException.hpp"
#include <algorithm>
#include <iostream>
#include <string>

namespace finger::application {

using domain::PresenceError;
namespace input = ports::input;

namespace {

const char* const AUTH_FAILED_MESSAGE = "invalid username or key";
const char* const STORE_UNAVAILABLE_MESSAGE = "storage is unavailable, try again later";

template <typename Result>
Result failure(PresenceError error, const std::string& message) {
    Result result;
    result.success = false;
    result.error = error;
    result.message = message;
    return result;
}

template <typename Result>
Result storeFailure(const char* operation, const domain::StoreUnavailableException& e) {
    std::cerr << "[PresenceService] " << operation << "() store failure: " << e.what() << std::endl;
    return failure<Result>(PresenceError::STORE_UNAVAILABLE, STORE_UNAVAILABLE_MESSAGE);
}

input::OperationResult ok(const std::string& message) {
    input::OperationResult result;
    result.success = true;
    result.message = message;
    return result;
}

} // namespace

PresenceService::PresenceService(
    std::shared_ptr<settings::PresenceSettings> settings,
    std::shared_ptr<ports::output::IAccountRepository> accountRepo,
    std::shared_ptr<ports::output::IPresenceRepository> presenceRepo,
    std::shared_ptr<ports::output::IVisibilityRepository> visibilityRepo,
    std::shared_ptr<ports::output::IClock> clock,
    std::shared_ptr<ports::output::ICredentialHasher> hasher
) : settings_(std::move(settings))
  , clock_(std::move(clock))
  , hasher_(hasher)
  , accounts_(std::move(accountRepo), std::move(hasher))
  , presence_(std::move(presenceRepo))
  , visibility_(std::move(visibilityRepo))
{
    std::cout << "[PresenceService] Created (registration: "
              << domain::toString(settings_->getRegistrationMode())
              << ", ttl: " << settings_->getPresenceTtl().count() << "s)" << std::endl;
}

input::RegisterResult PresenceService::registerUser(
    const std::string& username,
    const std::optional<std::string>& registrationKey
) {
    switch (settings_->getRegistrationMode()) {
        case domain::RegistrationMode::CLOSED:
            return failure<input::RegisterResult>(
                PresenceError::REGISTRATION_CLOSED, "registration is not allowed on this server");

        case domain::RegistrationMode::KEY_REQUIRED:
            if (!registrationKey) {
                return failure<input::RegisterResult>(
                    PresenceError::INVALID_REGISTRATION_KEY, "registration key is required on this server");
            }
            if (!hasher_->equals(*registrationKey, settings_->getRegistrationKey())) {
                return failure<input::RegisterResult>(
                    PresenceError::INVALID_REGISTRATION_KEY, "server registration key is invalid");
            }
            break;

        case domain::RegistrationMode::OPEN:
            break;
    }

    if (!domain::Account::isValidUsername(username)) {
        return failure<input::RegisterResult>(
            PresenceError::INVALID_USERNAME,
            "username must be 1 to " + std::to_string(domain::Account::MAX_USERNAME_LENGTH) + " bytes");
    }

    try {
        std::string authKey = hasher_->generateKey();
        if (!accounts_.create(username, authKey, clock_->now())) {
            return failure<input::RegisterResult>(PresenceError::USERNAME_TAKEN, "username already taken");
        }

        std::cout << "[PresenceService] Registered: " << username << std::endl;

        input::RegisterResult result;
        result.success = true;
        result.authKey = authKey;
        result.message = "account created";
        return result;

    } catch (const domain::StoreUnavailableException& e) {
        return storeFailure<input::RegisterResult>("register", e);
    }
}

input::OperationResult PresenceService::login(
    const std::string& username,
    const std::string& key,
    const std::optional<std::string>& status
) {
    try {
        if (!accounts_.verify(username, key)) {
            return failure<input::OperationResult>(PresenceError::AUTH_FAILED, AUTH_FAILED_MESSAGE);
        }

        auto guard = locks_.lock(username);
        presence_.setOnline(username, clock_->now(), settings_->getPresenceTtl(), status);

        std::cout << "[PresenceService] Online: " << username << std::endl;
        return ok("you are now logged on");

    } catch (const domain::StoreUnavailableException& e) {
        return storeFailure<input::OperationResult>("login", e);
    }
}

input::OperationResult PresenceService::logoff(const std::string& username, const std::string& key) {
    try {
        if (!accounts_.verify(username, key)) {
            return failure<input::OperationResult>(PresenceError::AUTH_FAILED, AUTH_FAILED_MESSAGE);
        }

        auto guard = locks_.lock(username);
        if (!presence_.setOffline(username, clock_->now())) {
            return failure<input::OperationResult>(PresenceError::NOT_ONLINE, "you are not online");
        }

        std::cout << "[PresenceService] Offline: " << username << std::endl;
        return ok("you are now logged off");

    } catch (const domain::StoreUnavailableException& e) {
        return storeFailure<input::OperationResult>("logoff", e);
    }
}

input::OperationResult PresenceService::bump(const std::string& username, const std::string& key) {
    try {
        if (!accounts_.verify(username, key)) {
            return failure<input::OperationResult>(PresenceError::AUTH_FAILED, AUTH_FAILED_MESSAGE);
        }

        auto guard = locks_.lock(username);
        if (!presence_.bump(username, clock_->now(), settings_->getPresenceTtl())) {
            return failure<input::OperationResult>(
                PresenceError::NOT_ONLINE, "you are not online, log in again");
        }
        return ok("you are bumped");

    } catch (const domain::StoreUnavailableException& e) {
        return storeFailure<input::OperationResult>("bump", e);
    }
}

input::FingerResult PresenceService::finger(
    const std::string& subject,
    const std::optional<input::Credentials>& caller
) {
    try {
        // Неверные учётные данные не превращаются в анонимный запрос
        if (caller && !accounts_.verify(caller->username, caller->key)) {
            return failure<input::FingerResult>(PresenceError::AUTH_FAILED, AUTH_FAILED_MESSAGE);
        }

        if (!accounts_.lookup(subject)) {
            return failure<input::FingerResult>(PresenceError::USER_NOT_FOUND, "user not found");
        }

        auto guard = locks_.lock(subject);
        auto now = clock_->now();
        auto status = presence_.getStatus(subject, now);

        if (caller && caller->username != subject) {
            visibility_.record(subject, caller->username, now);
        }

        input::FingerResult result;
        result.success = true;
        result.status = toView(subject, status, now);
        return result;

    } catch (const domain::StoreUnavailableException& e) {
        return storeFailure<input::FingerResult>("finger", e);
    }
}

input::ListResult PresenceService::list() {
    try {
        auto now = clock_->now();

        input::ListResult result;
        result.success = true;
        for (const auto& status : presence_.snapshot(now)) {
            if (status.online) {
                result.users.push_back(toView(status.username, status, now));
            }
        }

        std::sort(result.users.begin(), result.users.end(),
                  [](const domain::PresenceView& a, const domain::PresenceView& b) {
                      return a.username < b.username;
                  });
        return result;

    } catch (const domain::StoreUnavailableException& e) {
        return storeFailure<input::ListResult>("list", e);
    }
}

input::CheckResult PresenceService::check(const std::string& username, const std::string& key) {
    try {
        if (!accounts_.verify(username, key)) {
            return failure<input::CheckResult>(PresenceError::AUTH_FAILED, AUTH_FAILED_MESSAGE);
        }

        auto guard = locks_.lock(username);

        input::CheckResult result;
        result.success = true;
        result.checkers = visibility_.listCheckers(username);
        return result;

    } catch (const domain::StoreUnavailableException& e) {
        return storeFailure<input::CheckResult>("check", e);
    }
}

size_t PresenceService::expireStale() {
    auto now = clock_->now();
    size_t expired = 0;

    for (const auto& username : presence_.lapsedUsernames(now)) {
        auto guard = locks_.lock(username);
        if (presence_.expireIfLapsed(username, now)) {
            ++expired;
        }
    }

    if (expired > 0) {
        std::cout << "[PresenceService] Expired " << expired << " stale presence record(s)" << std::endl;
    }
    return expired;
}

domain::PresenceView PresenceService::toView(
    const std::string& username,
    const std::optional<domain::PresenceStatus>& status,
    const domain::Timestamp& now
) const {
    domain::PresenceView view;
    view.username = username;
    if (status) {
        view.online = status->online;
        view.message = status->message;
        view.sinceSeconds = now.secondsSince(status->since);
    }
    return view;
}

} // namespace finger::application
