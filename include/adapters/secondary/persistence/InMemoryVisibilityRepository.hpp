#pragma once

#include "ports/output/IVisibilityRepository.hpp"
#include <mutex>
#include <unordered_map>

namespace finger::adapters::secondary {

/**
 * @brief In-memory журнал проверок
 *
 * Записи по каждому subject лежат в порядке добавления.
 */
class InMemoryVisibilityRepository : public ports::output::IVisibilityRepository {
public:
    void append(const domain::VisibilityEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[entry.subject].push_back(entry);
    }

    std::vector<domain::VisibilityEntry> findBySubject(const std::string& username) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(username);
        if (it == entries_.end()) {
            return {};
        }
        return it->second;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t total = 0;
        for (const auto& [subject, list] : entries_) {
            total += list.size();
        }
        return total;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

private:
    std::unordered_map<std::string, std::vector<domain::VisibilityEntry>> entries_;
    mutable std::mutex mutex_;
};

} // namespace finger::adapters::secondary
