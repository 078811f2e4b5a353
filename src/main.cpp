#include "FingerApp.hpp"
#include "adapters/primary/Endpoints.hpp"
#include <iostream>
#include <csignal>

// Глобальный указатель для обработки сигналов
finger::FingerApp* g_app = nullptr;

static const char* signalName(int signal)
{
    switch (signal)
    {
        case SIGINT:  return "SIGINT";
        case SIGTERM: return "SIGTERM";
        default:      return "signal";
    }
}

void signalHandler(int signal)
{
    std::cout << "\n[main] Received " << signalName(signal) << ", shutting down" << std::endl;
    if (g_app)
    {
        g_app->stop();
    }
}

int main(int argc, char* argv[])
{
    try
    {
        finger::FingerApp app;
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "finger service: who is online, and who looked" << std::endl;
        std::cout << "  serving:";
        for (auto path : finger::adapters::primary::endpoints::ALL)
        {
            std::cout << " " << path;
        }
        std::cout << std::endl;

        // loadEnvironment() -> configureInjection() -> start()
        app.run(argc, argv);

        // Статусы в хранилище не трогаем: истёкшие окна станут offline сами
        std::cout << "[main] Stopped, presence windows left to expire on their own" << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
