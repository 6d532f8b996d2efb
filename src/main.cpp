#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

#include "grid_config.h"
#include "grid_service.h"
#include "pg_store.h"
#include "process_support.h"

void RunServer(const promptgrid::GridConfig& config) {
    auto store = std::make_shared<promptgrid::PgStore>(config.db.connection_string, config.db.pool_size);
    store->EnsureSchema();

    promptgrid::GridControlServiceImpl service(store);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(config.grpc_listen_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        throw std::runtime_error("Failed to listen on " + config.grpc_listen_address);
    }

    spdlog::info("GridControl listening on {}", config.grpc_listen_address);
    std::thread waiter([&server]() {
        while (!promptgrid::g_shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        server->Shutdown();
    });
    server->Wait();
    waiter.join();
}

auto main() -> int {
    promptgrid::GridConfig config;
    try {
        config = promptgrid::LoadGridConfig();
        promptgrid::InstallConsoleLogger("server", config.log_level);
        promptgrid::ValidateGridConfig(config);
    } catch (const std::exception& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 2;
    }
    promptgrid::InstallShutdownHandlers();

    spdlog::info("PromptGrid control plane starting...");
    try {
        RunServer(config);
    } catch (const std::exception& e) {
        spdlog::error("Server failed: {}", e.what());
        return 1;
    }
    promptgrid::DumpMetrics();
    return 0;
}
