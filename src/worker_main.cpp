#include <chrono>
#include <memory>
#include <thread>

#include <spdlog/spdlog.h>

#include "grid_config.h"
#include "http_predictor.h"
#include "pg_store.h"
#include "process_support.h"
#include "worker_pool.h"

namespace {

auto BuildPredictors(const promptgrid::GridConfig& config) -> promptgrid::PredictorRegistry {
    promptgrid::PredictorRegistry registry;
    const auto timeout = config.worker.predict_timeout;
    registry.Register("ollama",
                      std::make_shared<promptgrid::OllamaPredictor>(config.backends.ollama_url, timeout));
    if (!config.backends.chat_api_url.empty()) {
        registry.Register("chat", std::make_shared<promptgrid::ChatCompletionsPredictor>(
                                      config.backends.chat_api_url, config.backends.chat_api_key, timeout));
    }
    return registry;
}

} // namespace

int main() {
    promptgrid::GridConfig config;
    try {
        config = promptgrid::LoadGridConfig();
        promptgrid::InstallConsoleLogger("worker", config.log_level);
        promptgrid::ValidateGridConfig(config);
    } catch (const std::exception& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 2;
    }
    promptgrid::InstallShutdownHandlers();

    spdlog::info("PromptGrid worker starting with {} threads...", config.worker.threads);
    try {
        auto store = std::make_shared<promptgrid::PgStore>(config.db.connection_string, config.db.pool_size);
        store->EnsureSchema();
        auto predictors = BuildPredictors(config);
        promptgrid::SetMaxInFlightPredicts(config.worker.max_inflight_predicts);

        promptgrid::WorkerPool pool([store, predictors, &config]() {
            return std::make_unique<promptgrid::WorkerLoop>(store, predictors, config.worker);
        });
        pool.Start(config.worker.threads);

        while (!promptgrid::g_shutdown_requested.load() && pool.RunningCount() > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        pool.Stop();
    } catch (const std::exception& e) {
        spdlog::error("Worker failed: {}", e.what());
        return 1;
    }

    promptgrid::DumpMetrics();
    return 0;
}
