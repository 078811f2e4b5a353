#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IPresenceService.hpp"
#include "adapters/primary/RequestMetrics.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>

namespace finger::adapters::primary {

/**
 * @brief HTTP Handler для Prometheus метрик
 *
 * Endpoint: GET /metrics
 */
class MetricsHandler : public IHttpHandler {
public:
    MetricsHandler(
        std::shared_ptr<ports::input::IPresenceService> presenceService,
        std::shared_ptr<RequestMetrics> requestMetrics
    ) : presenceService_(std::move(presenceService))
      , requestMetrics_(std::move(requestMetrics))
      , startTime_(std::chrono::steady_clock::now())
    {
        std::cout << "[MetricsHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        ++scrapesTotal_;

        res.setStatus(200);
        res.setHeader("Content-Type", "text/plain; charset=utf-8");
        res.setBody(buildPrometheusMetrics());
    }

private:
    std::string buildPrometheusMetrics() const {
        std::ostringstream oss;

        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - startTime_).count();

        oss << "# HELP finger_uptime_seconds Time since application start\n";
        oss << "# TYPE finger_uptime_seconds gauge\n";
        oss << "finger_uptime_seconds " << uptime << "\n\n";

        // -1: хранилище не ответило
        auto online = presenceService_->list();
        oss << "# HELP finger_users_online Users currently online\n";
        oss << "# TYPE finger_users_online gauge\n";
        oss << "finger_users_online " << (online.success ? static_cast<int64_t>(online.users.size()) : -1) << "\n\n";

        requestMetrics_->writePrometheus(oss);
        oss << "\n";

        oss << "# HELP finger_metrics_scrapes_total Metrics endpoint scrapes\n";
        oss << "# TYPE finger_metrics_scrapes_total counter\n";
        oss << "finger_metrics_scrapes_total " << scrapesTotal_.load() << "\n";

        return oss.str();
    }

    std::shared_ptr<ports::input::IPresenceService> presenceService_;
    std::shared_ptr<RequestMetrics> requestMetrics_;
    std::chrono::steady_clock::time_point startTime_;
    std::atomic<int64_t> scrapesTotal_{0};
};

} // namespace finger::adapters::primary
