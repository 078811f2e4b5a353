#pragma once

#include "adapters/primary/PresenceHandler.hpp"

namespace finger::adapters::primary {

/**
 * @brief Статус пользователя
 *
 * Endpoint: GET /finger?user=alice[&username=bob&key=<auth key>]
 *
 * Response (200 OK):
 *   {
 *     "username": "alice",
 *     "online": true,
 *     "status": "at work",
 *     "since": 125
 *   }
 *
 * С учётными данными запрос попадает в журнал проверок alice.
 * Если передана только часть учётных данных (username без key или
 * наоборот), запрос не выполняется анонимно, а получает 401.
 * Заголовок Authorization со схемой, отличной от Bearer, игнорируется.
 *
 * Errors:
 *   400: нет user
 *   401: неверные учётные данные вызывающего
 *   404: пользователь user не зарегистрирован
 */
class FingerHandler : public PresenceHandler {
public:
    FingerHandler(
        std::shared_ptr<ports::input::IPresenceService> presenceService,
        std::shared_ptr<RequestMetrics> metrics
    ) : PresenceHandler("FingerHandler", std::move(presenceService), std::move(metrics)) {}

protected:
    int process(IRequest& req, IResponse& res) override {
        auto subject = param(req, "user");
        if (!subject) {
            return sendMissing(res, "user");
        }

        auto username = param(req, "username");
        auto key = authKey(req);

        std::optional<ports::input::Credentials> caller;
        if (username || key) {
            caller = ports::input::Credentials{username.value_or(""), key.value_or("")};
        }

        auto result = presenceService_->finger(*subject, caller);
        if (!result.success) {
            return sendFailure(res, result.error, result.message);
        }

        nlohmann::json response;
        response["username"] = result.status.username;
        response["online"] = result.status.online;
        response["status"] = result.status.message;
        response["since"] = result.status.sinceSeconds;
        return sendJson(res, 200, response);
    }
};

} // namespace finger::adapters::primary
