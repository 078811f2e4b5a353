#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace finger::adapters::primary {

/**
 * @brief Счётчики HTTP-запросов по endpoint и коду ответа
 *
 * Один экземпляр на приложение, общий для всех хэндлеров.
 */
class RequestMetrics {
public:
    void record(const std::string& endpoint, int status) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counters_[{endpoint, status}];
        ++total_;
    }

    uint64_t total() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_;
    }

    uint64_t count(const std::string& endpoint, int status) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find({endpoint, status});
        return it == counters_.end() ? 0 : it->second;
    }

    /**
     * @brief Строки finger_http_requests_total{endpoint=..., status=...} в формате Prometheus
     */
    void writePrometheus(std::ostringstream& oss) const {
        std::lock_guard<std::mutex> lock(mutex_);
        oss << "# HELP finger_http_requests_total HTTP requests by endpoint and status\n";
        oss << "# TYPE finger_http_requests_total counter\n";
        for (const auto& [key, value] : counters_) {
            oss << "finger_http_requests_total{endpoint=\"" << key.first
                << "\",status=\"" << key.second << "\"} " << value << "\n";
        }
    }

private:
    std::map<std::pair<std::string, int>, uint64_t> counters_;
    uint64_t total_ = 0;
    mutable std::mutex mutex_;
};

} // namespace finger::adapters::primary
