#pragma once

#include <BoostBeastApplication.hpp>
#include <IHttpHandler.hpp>
#include <boost/di.hpp>
#include <memory>

namespace finger::application {
    class OfflineSweeper;
}

namespace finger::settings {
    class PresenceSettings;
}

namespace finger {

/**
 * @class FingerApp
 * @brief Приложение finger-сервиса присутствия
 *
 * Наследует BoostBeastApplication с Template Method паттерном:
 * 1. loadEnvironment() - загрузка config.json в Environment
 * 2. configureInjection() - выбор хранилища, Boost.DI, регистрация handlers,
 *    запуск фоновой чистки статусов
 * 3. start() - запуск HTTP сервера (из базового класса)
 *
 * Хранилище выбирается по FINGER_STORAGE:
 * - memory: всё в памяти процесса
 * - file: учётные записи в JSON-файле, статусы и журнал в памяти
 * - postgres: всё в PostgreSQL
 */
class FingerApp : public BoostBeastApplication
{
public:
    FingerApp();
    ~FingerApp() override;

protected:
    void loadEnvironment(int argc, char* argv[]) override;

    void configureInjection() override;

private:
    std::unique_ptr<application::OfflineSweeper> sweeper_;

    void printStartupBanner(const settings::PresenceSettings& settings);
};

} // namespace finger
