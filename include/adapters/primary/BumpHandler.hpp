#pragma once

#include "adapters/primary/PresenceHandler.hpp"

namespace finger::adapters::primary {

/**
 * @brief Продление присутствия
 *
 * Endpoint: GET /bump?username=alice&key=<auth key>
 *
 * Окно отсчитывается заново от момента bump.
 *
 * Errors:
 *   400: нет username или key
 *   401: неверный username или key
 *   409: окно уже истекло или вход не выполнялся
 */
class BumpHandler : public PresenceHandler {
public:
    BumpHandler(
        std::shared_ptr<ports::input::IPresenceService> presenceService,
        std::shared_ptr<RequestMetrics> metrics
    ) : PresenceHandler("BumpHandler", std::move(presenceService), std::move(metrics)) {}

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

        auto result = presenceService_->bump(*username, *key);
        if (!result.success) {
            return sendFailure(res, result.error, result.message);
        }

        nlohmann::json response;
        response["message"] = result.message;
        return sendJson(res, 200, response);
    }
};

} // namespace finger::adapters::primary
