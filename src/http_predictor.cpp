#include "http_predictor.h"

#include <stdexcept>

#include <httplib.h>

namespace promptgrid {

namespace {

void ConfigureClient(httplib::Client& cli, std::chrono::seconds timeout) {
    cli.set_connection_timeout(5, 0);
    cli.set_read_timeout(static_cast<time_t>(timeout.count()), 0);
    cli.set_write_timeout(static_cast<time_t>(timeout.count()), 0);
}

auto CheckResponse(const httplib::Result& res, const std::string& endpoint) -> const httplib::Response& {
    if (!res) {
        throw std::runtime_error("HTTP request to " + endpoint + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw std::runtime_error("HTTP " + std::to_string(res->status) + " from " + endpoint + ": " +
                                 res->body.substr(0, 200));
    }
    return *res;
}

auto ElapsedMs(std::chrono::steady_clock::time_point start) -> double {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

OllamaPredictor::OllamaPredictor(std::string base_url, std::chrono::seconds timeout)
    : base_url_(std::move(base_url)), timeout_(timeout) {}

auto OllamaPredictor::BuildRequest(const Model& model, const std::string& rendered_prompt) -> nlohmann::json {
    return {
        {"model", model.name},
        {"prompt", rendered_prompt},
        {"stream", false},
        {"options", {{"temperature", 0}}}
    };
}

auto OllamaPredictor::ParseResponse(const std::string& body) -> std::string {
    auto j = nlohmann::json::parse(body);
    if (!j.contains("response") || !j["response"].is_string()) {
        throw std::runtime_error("Ollama response has no 'response' field");
    }
    return j["response"].get<std::string>();
}

auto OllamaPredictor::Predict(const Model& model, const Prompt& prompt, const Row& row) -> PredictResult {
    auto start = std::chrono::steady_clock::now();
    httplib::Client cli(base_url_);
    ConfigureClient(cli, timeout_);
    auto body = BuildRequest(model, RenderPrompt(prompt, row)).dump();
    auto res = cli.Post("/api/generate", body, "application/json");
    const auto& resp = CheckResponse(res, base_url_ + "/api/generate");

    PredictResult out;
    out.label = NormalizeLabel(ParseResponse(resp.body));
    out.latency_ms = ElapsedMs(start);
    return out;
}

ChatCompletionsPredictor::ChatCompletionsPredictor(std::string base_url, std::string api_key,
                                                   std::chrono::seconds timeout)
    : base_url_(std::move(base_url)), api_key_(std::move(api_key)), timeout_(timeout) {}

auto ChatCompletionsPredictor::BuildRequest(const Model& model, const std::string& rendered_prompt) -> nlohmann::json {
    return {
        {"model", model.name},
        {"messages", nlohmann::json::array({{{"role", "user"}, {"content", rendered_prompt}}})},
        {"temperature", 0}
    };
}

auto ChatCompletionsPredictor::ParseResponse(const std::string& body) -> std::string {
    auto j = nlohmann::json::parse(body);
    const auto& choices = j.at("choices");
    if (!choices.is_array() || choices.empty()) {
        throw std::runtime_error("Chat completion response has no choices");
    }
    return choices[0].at("message").at("content").get<std::string>();
}

auto ChatCompletionsPredictor::Predict(const Model& model, const Prompt& prompt, const Row& row) -> PredictResult {
    auto start = std::chrono::steady_clock::now();
    httplib::Client cli(base_url_);
    ConfigureClient(cli, timeout_);
    httplib::Headers headers;
    if (!api_key_.empty()) {
        headers.emplace("Authorization", "Bearer " + api_key_);
    }
    auto body = BuildRequest(model, RenderPrompt(prompt, row)).dump();
    auto res = cli.Post("/v1/chat/completions", headers, body, "application/json");
    const auto& resp = CheckResponse(res, base_url_ + "/v1/chat/completions");

    PredictResult out;
    out.label = NormalizeLabel(ParseResponse(resp.body));
    out.latency_ms = ElapsedMs(start);
    return out;
}

} // namespace promptgrid
