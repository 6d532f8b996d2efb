#include <chrono>
#include <memory>
#include <thread>

#include <spdlog/spdlog.h>

#include "grid_config.h"
#include "pg_store.h"
#include "process_support.h"
#include "watchdog.h"

int main() {
    promptgrid::GridConfig config;
    try {
        config = promptgrid::LoadGridConfig();
        promptgrid::InstallConsoleLogger("watchdog", config.log_level);
        promptgrid::ValidateGridConfig(config);
    } catch (const std::exception& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 2;
    }
    promptgrid::InstallShutdownHandlers();

    spdlog::info("PromptGrid watchdog starting...");
    try {
        auto store = std::make_shared<promptgrid::PgStore>(config.db.connection_string, config.db.pool_size);
        store->EnsureSchema();

        promptgrid::Watchdog watchdog(store, config.watchdog);
        watchdog.ReconcileStartup();
        watchdog.Start();

        while (!promptgrid::g_shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        watchdog.Stop();
    } catch (const std::exception& e) {
        spdlog::error("Watchdog failed: {}", e.what());
        return 1;
    }

    promptgrid::DumpMetrics();
    return 0;
}
