#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "obs/context.h"

namespace promptgrid {
namespace obs {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

inline auto ToSpdlogLevel(LogLevel level) -> spdlog::level::level_enum {
    switch (level) {
        case LogLevel::Debug:
            return spdlog::level::debug;
        case LogLevel::Info:
            return spdlog::level::info;
        case LogLevel::Warn:
            return spdlog::level::warn;
        case LogLevel::Error:
            return spdlog::level::err;
    }
    return spdlog::level::info;
}

// Name of the running binary (worker, watchdog, server); stamped on every event.
inline auto ServiceName() -> std::string& {
    static std::string name = "promptgrid";
    return name;
}

inline void SetServiceName(std::string name) {
    ServiceName() = std::move(name);
}

inline auto NowIso8601() -> std::string {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    std::time_t tt = system_clock::to_time_t(now);
    gmtime_r(&tt, &tm);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", tm, static_cast<int>(ms));
}

/**
 * @brief Emits one structured event as a single JSON line.
 *
 * Fields from the thread's obs::Context are added unless the caller already
 * set the same key.
 */
inline void LogEvent(LogLevel level,
                     const std::string& event,
                     const std::string& component,
                     const nlohmann::json& fields = nlohmann::json::object()) {
    auto spd_level = ToSpdlogLevel(level);
    if (!spdlog::should_log(spd_level)) return;

    nlohmann::json j = fields;
    j["ts"] = NowIso8601();
    j["level"] = spdlog::level::to_string_view(spd_level).data();
    j["service"] = ServiceName();
    j["event"] = event;
    j["component"] = component;
    if (HasContext()) {
        const auto& ctx = GetContext();
        for (const auto& kv : {std::make_pair("request_id", &ctx.request_id),
                               std::make_pair("worker_id", &ctx.worker_id),
                               std::make_pair("cell_id", &ctx.cell_id),
                               std::make_pair("model_id", &ctx.model_id),
                               std::make_pair("prompt_id", &ctx.prompt_id),
                               std::make_pair("dataset_id", &ctx.dataset_id)}) {
            if (!kv.second->empty() && !j.contains(kv.first)) {
                j[kv.first] = *kv.second;
            }
        }
    }
    spdlog::log(spd_level, "{}", j.dump());
}

// Logs `event` with duration_ms when stopped or destroyed.
class ScopedTimer {
public:
    ScopedTimer(std::string event, std::string component, nlohmann::json fields = nlohmann::json::object())
        : event_(std::move(event)),
          component_(std::move(component)),
          fields_(std::move(fields)),
          start_(std::chrono::steady_clock::now()) {}

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    void Stop(LogLevel level = LogLevel::Info, const nlohmann::json& extra = nlohmann::json::object()) {
        if (stopped_) return;
        stopped_ = true;
        nlohmann::json payload = fields_;
        payload.update(extra);
        payload["duration_ms"] = ElapsedMs();
        LogEvent(level, event_, component_, payload);
    }

    auto ElapsedMs() const -> double {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
    }

    ~ScopedTimer() {
        Stop(LogLevel::Info);
    }

private:
    std::string event_;
    std::string component_;
    nlohmann::json fields_;
    std::chrono::steady_clock::time_point start_;
    bool stopped_ = false;
};

} // namespace obs
} // namespace promptgrid
