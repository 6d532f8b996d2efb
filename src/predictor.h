#pragma once

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>

#include "types.h"

namespace promptgrid {

struct PredictResult {
    std::string label;
    double latency_ms = 0.0;
};

/**
 * @brief Raised when a predict call does not finish within the worker's timeout.
 */
class PredictTimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Raised instead of starting a predict call when the process already
 * has MaxInFlightPredicts() calls running.
 */
class PredictCapacityError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief One inference backend (model family).
 *
 * Predict may throw and must be safe to call again for the same input. It must
 * return or throw in bounded time (the HTTP backends bound it with their read
 * timeout): a call abandoned at the worker's deadline keeps its helper thread
 * and its in-flight slot until it returns.
 */
class IPredictor {
public:
    virtual ~IPredictor() = default;
    virtual auto Predict(const Model& model, const Prompt& prompt, const Row& row) -> PredictResult = 0;
};

/**
 * @brief Maps a model family (models.library) to the backend that serves it.
 */
class PredictorRegistry {
public:
    void Register(const std::string& family, std::shared_ptr<IPredictor> predictor);
    auto Get(const std::string& family) const -> std::shared_ptr<IPredictor>;
    auto Families() const -> std::set<std::string>;

private:
    std::map<std::string, std::shared_ptr<IPredictor>> predictors_;
};

// Fills the prompt template with the row content. "{text}" is replaced when
// present, otherwise the content is appended after a blank line.
auto RenderPrompt(const Prompt& prompt, const Row& row) -> std::string;

// Reduces a raw completion to a label: first non-empty line, trimmed,
// lower-cased, unquoted, without trailing punctuation.
auto NormalizeLabel(const std::string& raw) -> std::string;

// Process-wide cap on running predict calls, abandoned ones included.
constexpr size_t kDefaultMaxInFlightPredicts = 256;

// Throws std::invalid_argument for 0.
void SetMaxInFlightPredicts(size_t limit);
auto MaxInFlightPredicts() -> size_t;
auto InFlightPredicts() -> size_t;

// Starts predictor->Predict on a detached helper thread. The caller waits on
// the future with its own deadline; a call abandoned after the deadline keeps
// running and its result is discarded. When the in-flight cap is reached no
// thread is started and the future holds a PredictCapacityError.
auto LaunchPredict(const std::shared_ptr<IPredictor>& predictor,
                   const Model& model,
                   const Prompt& prompt,
                   const Row& row) -> std::future<PredictResult>;

// Launches one call and waits at most `timeout`; throws PredictTimeoutError.
auto PredictWithTimeout(const std::shared_ptr<IPredictor>& predictor,
                        const Model& model,
                        const Prompt& prompt,
                        const Row& row,
                        std::chrono::milliseconds timeout) -> PredictResult;

} // namespace promptgrid
