#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IPresenceService.hpp"
#include "adapters/primary/RequestMetrics.hpp"
#include "domain/enums/PresenceError.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace finger::adapters::primary {

/**
 * @brief Базовый хэндлер GET-endpoint'ов сервиса присутствия
 *
 * Template Method: handle() проверяет HTTP-метод, ловит исключения
 * и считает запросы, а разбор параметров и вызов сервиса делает
 * process() наследника. process() возвращает отправленный HTTP-код.
 *
 * Коды ошибок:
 *   400: нет обязательного параметра, INVALID_USERNAME
 *   401: AUTH_FAILED, REGISTRATION_CLOSED, INVALID_REGISTRATION_KEY
 *   404: USER_NOT_FOUND
 *   405: метод не GET
 *   409: USERNAME_TAKEN, NOT_ONLINE
 *   503: STORE_UNAVAILABLE
 *   500: необработанное исключение
 */
class PresenceHandler : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override {
        int status = 0;
        if (req.getMethod() != "GET") {
            res.setHeader("Allow", "GET");
            status = sendError(res, 405, "method not allowed");
        } else {
            try {
                status = process(req, res);
            } catch (const std::exception& e) {
                std::cerr << "[" << endpoint_ << "] Unhandled error: " << e.what() << std::endl;
                status = sendError(res, 500, "internal server error");
            }
        }
        metrics_->record(endpoint_, status);
    }

    static int httpStatusFor(domain::PresenceError error) {
        switch (error) {
            case domain::PresenceError::NONE:                     return 200;
            case domain::PresenceError::INVALID_USERNAME:         return 400;
            case domain::PresenceError::AUTH_FAILED:              return 401;
            case domain::PresenceError::REGISTRATION_CLOSED:      return 401;
            case domain::PresenceError::INVALID_REGISTRATION_KEY: return 401;
            case domain::PresenceError::USER_NOT_FOUND:           return 404;
            case domain::PresenceError::USERNAME_TAKEN:           return 409;
            case domain::PresenceError::NOT_ONLINE:               return 409;
            case domain::PresenceError::STORE_UNAVAILABLE:        return 503;
        }
        return 500;
    }

protected:
    PresenceHandler(
        std::string endpoint,
        std::shared_ptr<ports::input::IPresenceService> presenceService,
        std::shared_ptr<RequestMetrics> metrics
    ) : endpoint_(std::move(endpoint))
      , presenceService_(std::move(presenceService))
      , metrics_(std::move(metrics))
    {
        std::cout << "[" << endpoint_ << "] Created" << std::endl;
    }

    virtual int process(IRequest& req, IResponse& res) = 0;

    /**
     * @brief Непустой query-параметр
     */
    static std::optional<std::string> param(IRequest& req, const std::string& name) {
        auto value = req.getQueryParam(name);
        if (!value || value->empty()) {
            return std::nullopt;
        }
        return value;
    }

    /**
     * @brief Auth key: query-параметр key, иначе заголовок Authorization
     *
     * Заголовок принимается как "Bearer <key>" или как голый ключ.
     * Другие схемы ("Basic ...", "Digest ...") ключом не считаются:
     * их часто добавляет прокси, и анонимный finger не должен
     * из-за них получать 401.
     */
    static std::optional<std::string> authKey(IRequest& req) {
        if (auto key = param(req, "key")) {
            return key;
        }
        if (auto bearer = req.getBearerToken(); bearer && !bearer->empty()) {
            return bearer;
        }
        if (auto header = req.getHeader("Authorization");
            header && !header->empty() && header->find_first_of(" \t") == std::string::npos) {
            return header;
        }
        return std::nullopt;
    }

    /**
     * @brief '+' в тексте статуса означает пробел
     */
    static std::string decodeStatus(std::string text) {
        for (auto& c : text) {
            if (c == '+') c = ' ';
        }
        return text;
    }

    static int sendJson(IResponse& res, int status, const nlohmann::json& body) {
        res.setStatus(status);
        res.setHeader("Content-Type", "application/json");
        res.setBody(body.dump());
        return status;
    }

    static int sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        return sendJson(res, status, error);
    }

    static int sendFailure(IResponse& res, domain::PresenceError error, const std::string& message) {
        nlohmann::json body;
        body["error"] = message;
        body["code"] = domain::toString(error);
        return sendJson(res, httpStatusFor(error), body);
    }

    static int sendMissing(IResponse& res, const std::string& name) {
        return sendError(res, 400, "missing required parameter: " + name);
    }

    std::string endpoint_;
    std::shared_ptr<ports::input::IPresenceService> presenceService_;
    std::shared_ptr<RequestMetrics> metrics_;
};

} // namespace finger::adapters::primary
