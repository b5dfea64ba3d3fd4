/**
 * @file main.cpp
 * @brief
 */

// Standard Library Includes
#include <cstdlib>
#include <exception>
#include <string>
#include <utility>

// Third Party Includes
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

// Project Includes
#include <bsdmirrors/sync_engine/ControlListener.hpp>
#include <bsdmirrors/sync_engine/EngineConfig.hpp>
#include <bsdmirrors/sync_engine/SyncEngine.hpp>

// System Includes
#include <pthread.h>
#include <signal.h>

namespace
{
auto config_path() -> std::string
{
    const char* path = std::getenv("MIRRORS_CONFIG");

    return (path != nullptr) ? path : "configs/mirrors.json";
}
} // namespace

auto main() -> int
{
    using namespace bsdmirrors::sync_engine;

    spdlog::cfg::load_env_levels();

    // Every thread inherits this mask, so only sigwait below sees the signals
    sigset_t shutdownSignals;
    sigemptyset(&shutdownSignals);
    sigaddset(&shutdownSignals, SIGINT);
    sigaddset(&shutdownSignals, SIGTERM);

    if (const int rc = pthread_sigmask(SIG_BLOCK, &shutdownSignals, nullptr); rc != 0)
    {
        spdlog::error("Failed to block shutdown signals: error {}", rc);
        return EXIT_FAILURE;
    }

    try
    {
        auto config = EngineConfig::load(config_path());
        config.apply_environment();

        const auto port = config.controlPort;

        SyncEngine engine(std::move(config));
        engine.start();

        ControlListener listener(engine, port);
        listener.start();

        int signal = 0;
        if (const int rc = sigwait(&shutdownSignals, &signal); rc != 0)
        {
            spdlog::error("sigwait failed: error {}", rc);
        }
        else
        {
            spdlog::info("Received signal {}, shutting down", signal);
        }

        listener.stop();
        engine.stop();
    }
    catch (std::exception& e)
    {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
