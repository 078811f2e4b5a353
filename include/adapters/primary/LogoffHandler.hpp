#pragma once

#include "adapters/primary/PresenceHandler.hpp"

namespace finger::adapters::primary {

/**
 * @brief Выход: offline, текст статуса сохраняется
 *
 * Endpoint: GET /logoff?username=alice&key=<auth key>
 *
 * Errors:
 *   400: нет username или key
 *   401: неверный username или key
 *   409: пользователь не online
 */
class LogoffHandler : public PresenceHandler {
public:
    LogoffHandler(
        std::shared_ptr<ports::input::IPresenceService> presenceService,
        std::shared_ptr<RequestMetrics> metrics
    ) : PresenceHandler("LogoffHandler", std::move(presenceService), std::move(metrics)) {}

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

        auto result = presenceService_->logoff(*username, *key);
        if (!result.success) {
            return sendFailure(res, result.error, result.message);
        }

        nlohmann::json response;
        response["message"] = result.message;
        return sendJson(res, 200, response);
    }
};

} // namespace finger::adapters::primary
