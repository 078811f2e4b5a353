#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/Endpoints.hpp"
#include "ports/input/IPresenceService.hpp"
#include "settings/PresenceSettings.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

namespace finger::adapters::primary {

/**
 * @brief HTTP Handler для проверки здоровья сервиса
 *
 * Endpoint: GET /health
 *
 * 200 и "status": "ok", если хранилище отвечает,
 * иначе 503 и "status": "degraded". В "endpoints" перечислены
 * все обслуживаемые пути.
 */
class HealthHandler : public IHttpHandler
{
public:
    HealthHandler(
        std::shared_ptr<ports::input::IPresenceService> presenceService,
        std::shared_ptr<settings::PresenceSettings> settings
    ) : presenceService_(std::move(presenceService))
      , settings_(std::move(settings))
    {
        std::cout << "[HealthHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        bool storeReady = presenceService_->list().success;

        nlohmann::json response;
        response["status"] = storeReady ? "ok" : "degraded";
        response["timestamp"] = getCurrentTimestamp();

        nlohmann::json services;
        services["http_server"] = "ready";
        services["storage"] = storeReady ? "ready" : "unavailable";
        response["services"] = services;

        response["storage"] = settings_->getStorage();
        response["registration"] = domain::toString(settings_->getRegistrationMode());
        response["presence_ttl"] = settings_->getPresenceTtl().count();
        response["version"] = "1.0.0";

        nlohmann::json paths = nlohmann::json::array();
        for (auto path : endpoints::ALL) {
            paths.push_back(std::string(path));
        }
        response["endpoints"] = paths;

        res.setStatus(storeReady ? 200 : 503);
        res.setHeader("Content-Type", "application/json");
        res.setBody(response.dump(2));
    }

private:
    std::shared_ptr<ports::input::IPresenceService> presenceService_;
    std::shared_ptr<settings::PresenceSettings> settings_;

    std::string getCurrentTimestamp() const
    {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }
};

} // namespace finger::adapters::primary
