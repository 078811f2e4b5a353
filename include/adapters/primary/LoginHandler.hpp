#pragma once

#include "adapters/primary/PresenceHandler.hpp"

namespace finger::adapters::primary {

/**
 * @brief Вход: online на одно окно присутствия
 *
 * Endpoint: GET /login?username=alice&key=<auth key>[&status=at+work]
 *
 * Response (200 OK):
 *   { "message": "you are now logged on" }
 *
 * Без status сохраняется прежний текст статуса.
 *
 * Errors:
 *   400: нет username или key
 *   401: неверный username или key
 */
class LoginHandler : public PresenceHandler {
public:
    LoginHandler(
        std::shared_ptr<ports::input::IPresenceService> presenceService,
        std::shared_ptr<RequestMetrics> metrics
    ) : PresenceHandler("LoginHandler", std::move(presenceService), std::move(metrics)) {}

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

        // Пустой status допустим: он очищает текст
        std::optional<std::string> status;
        if (auto raw = req.getQueryParam("status")) {
            status = decodeStatus(*raw);
        }

        auto result = presenceService_->login(*username, *key, status);
        if (!result.success) {
            return sendFailure(res, result.error, result.message);
        }

        nlohmann::json response;
        response["message"] = result.message;
        return sendJson(res, 200, response);
    }
};

} // namespace finger::adapters::primary
