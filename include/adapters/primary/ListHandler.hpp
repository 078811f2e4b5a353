#pragma once

#include "adapters/primary/PresenceHandler.hpp"

namespace finger::adapters::primary {

/**
 * @brief Кто сейчас online
 *
 * Endpoint: GET /list
 *
 * Response (200 OK):
 *   {
 *     "users": [
 *       { "username": "alice", "status": "at work", "since": 125 }
 *     ]
 *   }
 */
class ListHandler : public PresenceHandler {
public:
    ListHandler(
        std::shared_ptr<ports::input::IPresenceService> presenceService,
        std::shared_ptr<RequestMetrics> metrics
    ) : PresenceHandler("ListHandler", std::move(presenceService), std::move(metrics)) {}

protected:
    int process(IRequest&, IResponse& res) override {
        auto result = presenceService_->list();
        if (!result.success) {
            return sendFailure(res, result.error, result.message);
        }

        nlohmann::json users = nlohmann::json::array();
        for (const auto& user : result.users) {
            users.push_back({
                {"username", user.username},
                {"status", user.message},
                {"since", user.sinceSeconds}
            });
        }

        nlohmann::json response;
        response["users"] = users;
        return sendJson(res, 200, response);
    }
};

} // namespace finger::adapters::primary
