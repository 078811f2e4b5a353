#pragma once

#include "adapters/primary/PresenceHandler.hpp"

namespace finger::adapters::primary {

/**
 * @brief Кто проверял мой статус
 *
 * Endpoint: GET /check?username=alice&key=<auth key>
 *
 * Response (200 OK):
 *   {
 *     "username": "alice",
 *     "checkers": [
 *       { "observer": "bob", "at": "2024-01-01T10:00:20Z" }
 *     ]
 *   }
 *
 * Журнал от старых записей к новым, чтение его не очищает.
 */
class CheckHandler : public PresenceHandler {
public:
    CheckHandler(
        std::shared_ptr<ports::input::IPresenceService> presenceService,
        std::shared_ptr<RequestMetrics> metrics
    ) : PresenceHandler("CheckHandler", std::move(presenceService), std::move(metrics)) {}

protected:
    int process(IRequest& req, IResponse& res) override {
        auto username = param(req, "username");
        if (!username) {
            return sendMissing(res, "username");
        }
        auto key = authKey(req);
        if (!key) {
            return sendMissing(res, "key");
        }

        auto result = presenceService_->check(*username, *key);
        if (!result.success) {
            return sendFailure(res, result.error, result.message);
        }

        nlohmann::json checkers = nlohmann::json::array();
        for (const auto& entry : result.checkers) {
            checkers.push_back({
                {"observer", entry.observer},
                {"at", entry.at.toString()}
            });
        }

        nlohmann::json response;
        response["username"] = *username;
        response["checkers"] = checkers;
        return sendJson(res, 200, response);
    }
};

} // namespace finger::adapters::primary
