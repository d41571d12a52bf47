#include "EngineApp.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

std::atomic<bool> g_stopRequested{false};

void signalHandler(int)
{
    g_stopRequested = true;
}

} // namespace

int main(int argc, char* argv[])
{
    try
    {
        const auto configPath = memtrade::settings::EngineSettings::resolveConfigPath(argc, argv);
        std::cout << "[main] Loading config " << configPath << std::endl;

        auto settings = std::make_shared<memtrade::settings::EngineSettings>(
            memtrade::settings::EngineSettings::load(configPath));

        EngineApp app(settings);

        // Обработчики сигналов для упорядоченной остановки
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        app.start();
        std::cout << "[main] Running, press Ctrl+C to stop" << std::endl;

        while (!g_stopRequested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::cout << "\n[main] Stop requested" << std::endl;
        auto report = app.stop();

        std::cout << "[main] Stopped" << (report.allOk() ? "" : " (shutdown reported errors)") << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
