#pragma once

#include "ports/output/IPresenceRepository.hpp"
#include "domain/PresenceStatus.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace finger::application {

/**
 * @brief Статусы присутствия с истечением по времени
 *
 * Истечение вычисляется при каждом чтении, фоновая чистка не нужна.
 * Методы, меняющие запись одного username, вызываются под блокировкой
 * этого username (её держит PresenceService).
 */
class PresenceStore {
public:
    explicit PresenceStore(std::shared_ptr<ports::output::IPresenceRepository> repository)
        : repository_(std::move(repository)) {}

    /**
     * @brief Эффективный статус на момент now
     *
     * nullopt означает, что пользователь ни разу не входил.
     * Истёкшая online-запись попутно переписывается в offline.
     */
    std::optional<domain::PresenceStatus> getStatus(const std::string& username, const domain::Timestamp& now) {
        auto stored = repository_->find(username);
        if (!stored) {
            return std::nullopt;
        }
        auto effective = stored->effectiveAt(now);
        if (stored->online && !effective.online) {
            repository_->save(effective);
        }
        return effective;
    }

    /**
     * @brief online = true, expiresAt = now + duration
     * @param message nullopt сохраняет прежний текст (или пустой)
     */
    void setOnline(
        const std::string& username,
        const domain::Timestamp& now,
        std::chrono::seconds duration,
        const std::optional<std::string>& message
    ) {
        auto stored = repository_->find(username);

        domain::PresenceStatus status;
        status.username = username;
        if (stored) {
            status = *stored;
        }

        bool wasOnline = stored && stored->isOnlineAt(now);
        status.online = true;
        status.expiresAt = now.plus(duration);
        if (message) {
            status.message = *message;
        }
        if (!wasOnline) {
            status.since = now;
        }
        repository_->save(status);
    }

    /**
     * @brief Сдвинуть expiresAt на now + duration
     * @return false если пользователь не online в момент now
     */
    bool bump(const std::string& username, const domain::Timestamp& now, std::chrono::seconds duration) {
        auto stored = repository_->find(username);
        if (!stored || !stored->isOnlineAt(now)) {
            if (stored && stored->online) {
                repository_->save(stored->effectiveAt(now));
            }
            return false;
        }
        stored->expiresAt = now.plus(duration);
        repository_->save(*stored);
        return true;
    }

    /**
     * @brief Перевести в offline, текст статуса не трогается
     * @return false если пользователь и так не online
     */
    bool setOffline(const std::string& username, const domain::Timestamp& now) {
        auto stored = repository_->find(username);
        if (!stored || !stored->isOnlineAt(now)) {
            if (stored && stored->online) {
                repository_->save(stored->effectiveAt(now));
            }
            return false;
        }
        stored->online = false;
        stored->since = now;
        repository_->save(*stored);
        return true;
    }

    /**
     * @brief Снимок эффективных статусов всех пользователей (без записи)
     */
    std::vector<domain::PresenceStatus> snapshot(const domain::Timestamp& now) {
        std::vector<domain::PresenceStatus> result;
        for (const auto& stored : repository_->findAll()) {
            result.push_back(stored.effectiveAt(now));
        }
        return result;
    }

    /**
     * @brief Имена тех, чья online-запись уже истекла
     */
    std::vector<std::string> lapsedUsernames(const domain::Timestamp& now) {
        std::vector<std::string> result;
        for (const auto& stored : repository_->findAll()) {
            if (stored.online && !stored.isOnlineAt(now)) {
                result.push_back(stored.username);
            }
        }
        return result;
    }

    /**
     * @brief Переписать запись в offline, если она истекла
     * @return true если запись была переписана
     */
    bool expireIfLapsed(const std::string& username, const domain::Timestamp& now) {
        auto stored = repository_->find(username);
        if (!stored || !stored->online || stored->isOnlineAt(now)) {
            return false;
        }
        repository_->save(stored->effectiveAt(now));
        return true;
    }

private:
    std::shared_ptr<ports::output::IPresenceRepository> repository_;
};

} // namespace finger::application
