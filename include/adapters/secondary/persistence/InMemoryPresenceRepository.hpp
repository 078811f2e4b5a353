#pragma once

#include "ports/output/IPresenceRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>

namespace finger::adapters::secondary {

/**
 * @brief In-memory реализация репозитория статусов
 */
class InMemoryPresenceRepository : public ports::output::IPresenceRepository {
public:
    std::optional<domain::PresenceStatus> find(const std::string& username) override {
        auto status = statuses_.find(username);
        return status ? std::optional<domain::PresenceStatus>(*status) : std::nullopt;
    }

    void save(const domain::PresenceStatus& status) override {
        statuses_.insert(status.username, std::make_shared<domain::PresenceStatus>(status));
    }

    std::vector<domain::PresenceStatus> findAll() override {
        std::vector<domain::PresenceStatus> result;
        for (const auto& status : statuses_.values()) {
            result.push_back(*status);
        }
        return result;
    }

    void clear() {
        statuses_.clear();
    }

private:
    ThreadSafeMap<std::string, domain::PresenceStatus> statuses_;
};

} // namespace finger::adapters::secondary
