#pragma once

#include "ports/output/IVisibilityRepository.hpp"
#include "domain/VisibilityEntry.hpp"
#include <memory>
#include <string>
#include <vector>

namespace finger::application {

/**
 * @brief Журнал "кто меня проверял"
 */
class VisibilityLog {
public:
    explicit VisibilityLog(std::shared_ptr<ports::output::IVisibilityRepository> repository)
        : repository_(std::move(repository)) {}

    void record(const std::string& subject, const std::string& observer, const domain::Timestamp& at) {
        repository_->append(domain::VisibilityEntry(observer, subject, at));
    }

    std::vector<domain::VisibilityEntry> listCheckers(const std::string& username) {
        return repository_->findBySubject(username);
    }

private:
    std::shared_ptr<ports::output::IVisibilityRepository> repository_;
};

} // namespace finger::application
