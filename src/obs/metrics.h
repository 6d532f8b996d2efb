#pragma once

#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "../metrics.h"
#include "obs/logging.h"

namespace promptgrid {
namespace obs {

inline nlohmann::json LabelsToJson(const std::map<std::string, std::string>& labels) {
    nlohmann::json l = nlohmann::json::object();
    for (const auto& kv : labels) {
        l[kv.first] = kv.second;
    }
    return l;
}

inline void EmitCounter(const std::string& name,
                        long value,
                        const std::string& unit,
                        const std::string& component,
                        const std::map<std::string, std::string>& labels = {},
                        const nlohmann::json& fields = nlohmann::json::object()) {
    ::promptgrid::metrics::MetricsRegistry::Instance().Increment(name, labels, value);
    nlohmann::json payload = fields;
    payload["metric_name"] = name;
    payload["value"] = value;
    payload["unit"] = unit;
    if (!labels.empty()) {
        payload["labels"] = LabelsToJson(labels);
    }
    LogEvent(LogLevel::Debug, "metric", component, payload);
}

inline void EmitGauge(const std::string& name,
                      double value,
                      const std::string& unit,
                      const std::string& component) {
    ::promptgrid::metrics::MetricsRegistry::Instance().SetGauge(name, value);
    LogEvent(LogLevel::Debug, "metric", component,
             {{"metric_name", name}, {"value", value}, {"unit", unit}});
}

inline void EmitHistogram(const std::string& name,
                          double value,
                          const std::string& unit,
                          const std::string& component,
                          const std::map<std::string, std::string>& labels = {},
                          const nlohmann::json& fields = nlohmann::json::object()) {
    ::promptgrid::metrics::MetricsRegistry::Instance().RecordLatency(name, labels, value);
    nlohmann::json payload = fields;
    payload["metric_name"] = name;
    payload["value"] = value;
    payload["unit"] = unit;
    if (!labels.empty()) {
        payload["labels"] = LabelsToJson(labels);
    }
    LogEvent(LogLevel::Debug, "metric", component, payload);
}

} // namespace obs
} // namespace promptgrid
