#pragma once

#include "adapters/primary/PresenceHandler.hpp"

namespace finger::adapters::primary {

/**
 * @brief Регистрация нового username
 *
 * Endpoint: GET /register?username=alice[&key=<registration key>]
 *
 * Response (201 Created):
 *   {
 *     "username": "alice",
 *     "key": "3f0c9a8e-...",
 *     "message": "account created"
 *   }
 *
 * Ключ показывается только в этом ответе, повторно его не получить.
 *
 * Errors:
 *   400: нет username или он длиннее 64 байт
 *   401: регистрация закрыта или неверный ключ регистрации
 *   409: username занят
 */
class RegisterHandler : public PresenceHandler {
public:
    RegisterHandler(
        std::shared_ptr<ports::input::IPresenceService> presenceService,
        std::shared_ptr<RequestMetrics> metrics
    ) : PresenceHandler("RegisterHandler", std::move(presenceService), std::move(metrics)) {}

protected:
    int process(IRequest& req, IResponse& res) override {
        auto username = param(req, "username");
        if (!username) {
            return sendMissing(res, "username");
        }

        auto result = presenceService_->registerUser(*username, param(req, "key"));
        if (!result.success) {
            return sendFailure(res, result.error, result.message);
        }

        nlohmann::json response;
        response["username"] = *username;
        response["key"] = result.authKey;
        response["message"] = result.message;
        return sendJson(res, 201, response);
    }
};

} // namespace finger::adapters::primary
