#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "predictor.h"

namespace promptgrid {

/**
 * @brief Local LLM server speaking the Ollama generate API (POST /api/generate).
 */
class OllamaPredictor : public IPredictor {
public:
    OllamaPredictor(std::string base_url, std::chrono::seconds timeout);

    auto Predict(const Model& model, const Prompt& prompt, const Row& row) -> PredictResult override;

    static auto BuildRequest(const Model& model, const std::string& rendered_prompt) -> nlohmann::json;
    static auto ParseResponse(const std::string& body) -> std::string;

private:
    std::string base_url_;
    std::chrono::seconds timeout_;
};

/**
 * @brief Hosted chat-completions API (POST /v1/chat/completions, bearer auth).
 */
class ChatCompletionsPredictor : public IPredictor {
public:
    ChatCompletionsPredictor(std::string base_url, std::string api_key, std::chrono::seconds timeout);

    auto Predict(const Model& model, const Prompt& prompt, const Row& row) -> PredictResult override;

    static auto BuildRequest(const Model& model, const std::string& rendered_prompt) -> nlohmann::json;
    static auto ParseResponse(const std::string& body) -> std::string;

private:
    std::string base_url_;
    std::string api_key_;
    std::chrono::seconds timeout_;
};

} // namespace promptgrid
