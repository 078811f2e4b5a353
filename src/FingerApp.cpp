#include "FingerApp.hpp"

#include <IEnvironment.hpp>

// Handlers (Primary Adapters)
#include "adapters/primary/Endpoints.hpp"
#include "adapters/primary/RequestMetrics.hpp"
#include "adapters/primary/RegisterHandler.hpp"
#include "adapters/primary/LoginHandler.hpp"
#include "adapters/primary/LogoffHandler.hpp"
#include "adapters/primary/BumpHandler.hpp"
#include "adapters/primary/FingerHandler.hpp"
#include "adapters/primary/ListHandler.hpp"
#include "adapters/primary/CheckHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"

// Application Services
#include "application/PresenceService.hpp"
#include "application/OfflineSweeper.hpp"

// Secondary Adapters
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/OpenSslCredentialHasher.hpp"
#include "adapters/secondary/persistence/InMemoryAccountRepository.hpp"
#include "adapters/secondary/persistence/InMemoryPresenceRepository.hpp"
#include "adapters/secondary/persistence/InMemoryVisibilityRepository.hpp"
#include "adapters/secondary/persistence/JsonFileAccountRepository.hpp"
#include "adapters/secondary/persistence/PostgresAccountRepository.hpp"
#include "adapters/secondary/persistence/PostgresPresenceRepository.hpp"
#include "adapters/secondary/persistence/PostgresVisibilityRepository.hpp"

// Settings
#include "settings/PresenceSettings.hpp"
#include "settings/DbSettings.hpp"

#include <iostream>

namespace di = boost::di;

namespace finger {

using namespace finger::adapters;

FingerApp::FingerApp()
{
    std::cout << "[FingerApp] Application created" << std::endl;
}

FingerApp::~FingerApp()
{
    if (sweeper_) {
        sweeper_->stop();
    }
    std::cout << "[FingerApp] Application destroyed" << std::endl;
}

void FingerApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[FingerApp] Loading environment..." << std::endl;

    // Вызываем базовый метод который загружает config.json в env_
    BoostBeastApplication::loadEnvironment(argc, argv);

    std::cout << "[FingerApp] Environment loaded successfully" << std::endl;
}

void FingerApp::configureInjection()
{
    auto presenceSettings = std::make_shared<settings::PresenceSettings>();
    printStartupBanner(*presenceSettings);

    // ========================================================================
    // Хранилища выбираются в runtime, поэтому биндятся готовыми экземплярами
    // ========================================================================

    std::shared_ptr<ports::output::IAccountRepository> accountRepo;
    std::shared_ptr<ports::output::IPresenceRepository> presenceRepo;
    std::shared_ptr<ports::output::IVisibilityRepository> visibilityRepo;

    const std::string storage = presenceSettings->getStorage();
    if (storage == "postgres") {
        auto dbSettings = std::make_shared<settings::DbSettings>();
        accountRepo = std::make_shared<secondary::PostgresAccountRepository>(dbSettings);
        presenceRepo = std::make_shared<secondary::PostgresPresenceRepository>(dbSettings);
        visibilityRepo = std::make_shared<secondary::PostgresVisibilityRepository>(dbSettings);
    } else {
        if (storage == "file") {
            accountRepo = std::make_shared<secondary::JsonFileAccountRepository>(
                presenceSettings->getUsersFile());
        } else {
            accountRepo = std::make_shared<secondary::InMemoryAccountRepository>();
        }
        presenceRepo = std::make_shared<secondary::InMemoryPresenceRepository>();
        visibilityRepo = std::make_shared<secondary::InMemoryVisibilityRepository>();
    }

    std::cout << "[FingerApp] Configuring Boost.DI injection..." << std::endl;

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Settings & Infrastructure
        // ====================================================================

        di::bind<IEnvironment>().to(env_),

        di::bind<settings::PresenceSettings>().to(presenceSettings),

        di::bind<primary::RequestMetrics>().to(std::make_shared<primary::RequestMetrics>()),

        // ====================================================================
        // Layer 2: Secondary Adapters (Output Ports implementations)
        // ====================================================================

        di::bind<ports::output::IAccountRepository>().to(accountRepo),
        di::bind<ports::output::IPresenceRepository>().to(presenceRepo),
        di::bind<ports::output::IVisibilityRepository>().to(visibilityRepo),

        di::bind<ports::output::IClock>()
            .to<secondary::SystemClock>()
            .in(di::singleton),

        di::bind<ports::output::ICredentialHasher>()
            .to<secondary::OpenSslCredentialHasher>()
            .in(di::singleton),

        // ====================================================================
        // Layer 3: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<ports::input::IPresenceService>()
            .to<application::PresenceService>()
            .in(di::singleton)
    );

    std::cout << "[FingerApp] DI Injector configured (storage: " << storage << ")" << std::endl;

    // ========================================================================
    // Layer 4: Primary Adapters (HTTP Handlers)
    // ========================================================================

    std::cout << "[FingerApp] Registering HTTP Handlers via DI..." << std::endl;

    {
        auto handler = injector.create<std::shared_ptr<primary::RegisterHandler>>();
        registerEndpoint("GET", std::string(primary::endpoints::REGISTER), handler);
        std::cout << "  ✓ RegisterHandler: GET /register" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<primary::LoginHandler>>();
        registerEndpoint("GET", std::string(primary::endpoints::LOGIN), handler);
        std::cout << "  ✓ LoginHandler: GET /login" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<primary::LogoffHandler>>();
        registerEndpoint("GET", std::string(primary::endpoints::LOGOFF), handler);
        std::cout << "  ✓ LogoffHandler: GET /logoff" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<primary::BumpHandler>>();
        registerEndpoint("GET", std::string(primary::endpoints::BUMP), handler);
        std::cout << "  ✓ BumpHandler: GET /bump" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<primary::FingerHandler>>();
        registerEndpoint("GET", std::string(primary::endpoints::FINGER), handler);
        std::cout << "  ✓ FingerHandler: GET /finger" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<primary::ListHandler>>();
        registerEndpoint("GET", std::string(primary::endpoints::LIST), handler);
        std::cout << "  ✓ ListHandler: GET /list" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<primary::CheckHandler>>();
        registerEndpoint("GET", std::string(primary::endpoints::CHECK), handler);
        std::cout << "  ✓ CheckHandler: GET /check" << std::endl;
    }

    // Health & Metrics
    {
        auto handler = injector.create<std::shared_ptr<primary::HealthHandler>>();
        registerEndpoint("GET", std::string(primary::endpoints::HEALTH), handler);
        std::cout << "  ✓ HealthHandler: GET /health" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<primary::MetricsHandler>>();
        registerEndpoint("GET", std::string(primary::endpoints::METRICS), handler);
        std::cout << "  ✓ MetricsHandler: GET /metrics" << std::endl;
    }

    // ========================================================================
    // Background: перевод истёкших статусов в offline
    // ========================================================================

    auto sweepInterval = presenceSettings->getSweepInterval();
    if (sweepInterval.count() > 0) {
        sweeper_ = std::make_unique<application::OfflineSweeper>(
            injector.create<std::shared_ptr<ports::input::IPresenceService>>(),
            std::chrono::duration_cast<std::chrono::milliseconds>(sweepInterval));
        sweeper_->start();
    } else {
        std::cout << "[FingerApp] Offline sweeper disabled" << std::endl;
    }

    std::cout << "[FingerApp] Configuration complete! " << primary::endpoints::ALL.size()
              << " handlers registered." << std::endl;
}

void FingerApp::printStartupBanner(const settings::PresenceSettings& settings)
{
    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  finger presence service" << std::endl;
    std::cout << "  registration: " << domain::toString(settings.getRegistrationMode()) << std::endl;
    std::cout << "  presence ttl: " << settings.getPresenceTtl().count() << "s" << std::endl;
    std::cout << "  storage:      " << settings.getStorage() << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;
}

} // namespace finger
