#pragma once

#include <atomic>
#include <csignal>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "metrics.h"
#include "obs/logging.h"

namespace promptgrid {

inline std::atomic<bool> g_shutdown_requested{false};

inline void HandleShutdownSignal(int /*signum*/) {
    g_shutdown_requested.store(true);
}

// Installs the colored console logger, tags events with `service` and
// applies LOG_LEVEL.
inline void InstallConsoleLogger(const std::string& service, const std::string& level) {
    obs::SetServiceName(service);
    auto console = spdlog::stdout_color_mt("console");
    spdlog::set_default_logger(console);
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown LOG_LEVEL '{}', using info", level);
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
}

inline void InstallShutdownHandlers() {
    std::signal(SIGINT, HandleShutdownSignal);
    std::signal(SIGTERM, HandleShutdownSignal);
}

inline void DumpMetrics() {
    spdlog::info("Final metrics:\n{}", metrics::MetricsRegistry::Instance().ToPrometheus());
}

} // namespace promptgrid
