#include "grid_config.h"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>

namespace promptgrid {

namespace {

auto Trim(const std::string& s) -> std::string {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) { return ""; }
    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

auto ParseIntVar(const char* name, const char* value) -> long {
    try {
        size_t consumed = 0;
        long v = std::stol(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument(fmt::format("{} must be an integer, got '{}'", name, value));
    }
}

auto ParseBoolVar(const char* name, const char* value) -> bool {
    std::string v = value;
    if (v == "1" || v == "true" || v == "yes") { return true; }
    if (v == "0" || v == "false" || v == "no") { return false; }
    throw std::invalid_argument(fmt::format("{} must be a boolean, got '{}'", name, value));
}

} // namespace

auto ParseFamilies(const std::string& csv) -> std::set<std::string> {
    std::set<std::string> out;
    std::istringstream in(csv);
    std::string item;
    while (std::getline(in, item, ',')) {
        auto f = Trim(item);
        if (!f.empty()) { out.insert(f); }
    }
    return out;
}

auto LoadGridConfig(const EnvLookup& env) -> GridConfig {
    EnvLookup get = env ? env : EnvLookup([](const char* name) { return std::getenv(name); });
    GridConfig config;

    if (const char* v = get("DB_CONNECTION_STRING")) {
        config.db.connection_string = v;
    } else if (get("DB_HOST") && get("DB_NAME")) {
        const char* user = get("DB_USER");
        const char* password = get("DB_PASSWORD");
        const char* port = get("DB_PORT");
        config.db.connection_string = fmt::format(
            "postgresql://{}{}@{}:{}/{}",
            user ? user : "postgres",
            password ? fmt::format(":{}", password) : "",
            get("DB_HOST"), port ? port : "5432", get("DB_NAME"));
    }
    if (const char* v = get("DB_POOL_SIZE")) {
        config.db.pool_size = static_cast<size_t>(ParseIntVar("DB_POOL_SIZE", v));
    }

    if (const char* v = get("GRID_WORKER_FAMILIES")) {
        config.worker.families = ParseFamilies(v);
    }
    if (const char* v = get("GRID_WORKER_THREADS")) {
        config.worker.threads = static_cast<int>(ParseIntVar("GRID_WORKER_THREADS", v));
    }
    if (const char* v = get("GRID_BATCH_SIZE")) {
        config.worker.batch_size = static_cast<int>(ParseIntVar("GRID_BATCH_SIZE", v));
    }
    if (const char* v = get("GRID_MAX_RETRIES")) {
        config.worker.max_retries = static_cast<int>(ParseIntVar("GRID_MAX_RETRIES", v));
        config.watchdog.max_retries = config.worker.max_retries;
    }
    if (const char* v = get("GRID_PREDICT_TIMEOUT_SECONDS")) {
        config.worker.predict_timeout = std::chrono::seconds(ParseIntVar("GRID_PREDICT_TIMEOUT_SECONDS", v));
    }
    if (const char* v = get("GRID_JOIN_ACTIVE_CELLS")) {
        config.worker.join_active_cells = ParseBoolVar("GRID_JOIN_ACTIVE_CELLS", v);
    }
    if (const char* v = get("GRID_IDLE_POLL_SECONDS")) {
        config.worker.idle_poll = std::chrono::seconds(ParseIntVar("GRID_IDLE_POLL_SECONDS", v));
    }
    if (const char* v = get("GRID_EXIT_WHEN_IDLE")) {
        config.worker.exit_when_idle = ParseBoolVar("GRID_EXIT_WHEN_IDLE", v);
    }
    if (const char* v = get("GRID_MAX_INFLIGHT_PREDICTS")) {
        auto limit = ParseIntVar("GRID_MAX_INFLIGHT_PREDICTS", v);
        if (limit <= 0) {
            throw std::invalid_argument("GRID_MAX_INFLIGHT_PREDICTS must be positive");
        }
        config.worker.max_inflight_predicts = static_cast<size_t>(limit);
    }
    if (const char* v = get("GRID_STALE_THRESHOLD_SECONDS")) {
        config.watchdog.stale_threshold = std::chrono::seconds(ParseIntVar("GRID_STALE_THRESHOLD_SECONDS", v));
    }
    if (const char* v = get("GRID_WATCHDOG_INTERVAL_SECONDS")) {
        config.watchdog.interval = std::chrono::seconds(ParseIntVar("GRID_WATCHDOG_INTERVAL_SECONDS", v));
    }

    if (const char* v = get("OLLAMA_URL")) { config.backends.ollama_url = v; }
    if (const char* v = get("CHAT_API_URL")) { config.backends.chat_api_url = v; }
    if (const char* v = get("CHAT_API_KEY")) { config.backends.chat_api_key = v; }
    if (const char* v = get("GRPC_LISTEN_ADDRESS")) { config.grpc_listen_address = v; }
    if (const char* v = get("LOG_LEVEL")) { config.log_level = v; }

    return config;
}

auto ValidateGridConfig(const GridConfig& config) -> void {
    if (config.db.pool_size == 0) {
        throw std::invalid_argument("DB_POOL_SIZE must be positive");
    }
    if (config.worker.threads <= 0) {
        throw std::invalid_argument("GRID_WORKER_THREADS must be positive");
    }
    if (config.worker.batch_size <= 0) {
        throw std::invalid_argument("GRID_BATCH_SIZE must be positive");
    }
    if (config.worker.max_retries < 0 || config.watchdog.max_retries < 0) {
        throw std::invalid_argument("GRID_MAX_RETRIES must not be negative");
    }
    if (config.worker.predict_timeout.count() <= 0) {
        throw std::invalid_argument("GRID_PREDICT_TIMEOUT_SECONDS must be positive");
    }
    if (config.worker.idle_poll.count() <= 0) {
        throw std::invalid_argument("GRID_IDLE_POLL_SECONDS must be positive");
    }
    if (config.worker.max_inflight_predicts < static_cast<size_t>(config.worker.batch_size)) {
        throw std::invalid_argument("GRID_MAX_INFLIGHT_PREDICTS must be at least GRID_BATCH_SIZE");
    }
    if (config.watchdog.interval.count() <= 0) {
        throw std::invalid_argument("GRID_WATCHDOG_INTERVAL_SECONDS must be positive");
    }
    // A slow but live predict call must never look stale to the watchdog.
    if (config.worker.predict_timeout >= config.watchdog.stale_threshold) {
        throw std::invalid_argument(fmt::format(
            "GRID_PREDICT_TIMEOUT_SECONDS ({}) must be shorter than GRID_STALE_THRESHOLD_SECONDS ({})",
            config.worker.predict_timeout.count(), config.watchdog.stale_threshold.count()));
    }
}

} // namespace promptgrid
