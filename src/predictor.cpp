#include "predictor.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <future>
#include <sstream>
#include <system_error>
#include <thread>

namespace promptgrid {

namespace {

std::atomic<size_t> g_in_flight{0};
std::atomic<size_t> g_max_in_flight{kDefaultMaxInFlightPredicts};

} // namespace

void PredictorRegistry::Register(const std::string& family, std::shared_ptr<IPredictor> predictor) {
    if (!predictor) {
        throw std::invalid_argument("Null predictor for family " + family);
    }
    predictors_[family] = std::move(predictor);
}

auto PredictorRegistry::Get(const std::string& family) const -> std::shared_ptr<IPredictor> {
    auto it = predictors_.find(family);
    return it == predictors_.end() ? nullptr : it->second;
}

auto PredictorRegistry::Families() const -> std::set<std::string> {
    std::set<std::string> out;
    for (const auto& kv : predictors_) {
        out.insert(kv.first);
    }
    return out;
}

auto RenderPrompt(const Prompt& prompt, const Row& row) -> std::string {
    static const std::string kPlaceholder = "{text}";
    auto pos = prompt.text.find(kPlaceholder);
    if (pos == std::string::npos) {
        return prompt.text + "\n\n" + row.content;
    }
    std::string out = prompt.text;
    while (pos != std::string::npos) {
        out.replace(pos, kPlaceholder.size(), row.content);
        pos = out.find(kPlaceholder, pos + row.content.size());
    }
    return out;
}

auto NormalizeLabel(const std::string& raw) -> std::string {
    std::istringstream in(raw);
    std::string line;
    while (std::getline(in, line)) {
        auto first = std::find_if_not(line.begin(), line.end(), [](unsigned char c) {
            return std::isspace(c) || c == '"' || c == '\'';
        });
        auto last = std::find_if_not(line.rbegin(), line.rend(), [](unsigned char c) {
            return std::isspace(c) || c == '.' || c == '!' || c == '"' || c == '\'';
        }).base();
        if (first >= last) { continue; }
        std::string label(first, last);
        std::transform(label.begin(), label.end(), label.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return label;
    }
    return "";
}

void SetMaxInFlightPredicts(size_t limit) {
    if (limit == 0) {
        throw std::invalid_argument("In-flight predict limit must be positive");
    }
    g_max_in_flight.store(limit);
}

auto MaxInFlightPredicts() -> size_t {
    return g_max_in_flight.load();
}

auto InFlightPredicts() -> size_t {
    return g_in_flight.load();
}

auto LaunchPredict(const std::shared_ptr<IPredictor>& predictor,
                   const Model& model,
                   const Prompt& prompt,
                   const Row& row) -> std::future<PredictResult> {
    auto promise = std::make_shared<std::promise<PredictResult>>();
    auto future = promise->get_future();

    auto limit = g_max_in_flight.load();
    if (g_in_flight.fetch_add(1) >= limit) {
        g_in_flight.fetch_sub(1);
        promise->set_exception(std::make_exception_ptr(PredictCapacityError(
            "predict capacity exhausted (" + std::to_string(limit) + " calls in flight)")));
        return future;
    }

    // The helper owns copies of its inputs so it may outlive this call. The slot
    // is returned before the result is published.
    try {
        std::thread([promise, predictor, model, prompt, row]() {
            PredictResult result;
            std::exception_ptr error;
            try {
                result = predictor->Predict(model, prompt, row);
            } catch (...) {
                error = std::current_exception();
            }
            g_in_flight.fetch_sub(1);
            if (error) {
                promise->set_exception(error);
            } else {
                promise->set_value(std::move(result));
            }
        }).detach();
    } catch (const std::system_error&) {
        g_in_flight.fetch_sub(1);
        throw;
    }
    return future;
}

auto PredictWithTimeout(const std::shared_ptr<IPredictor>& predictor,
                        const Model& model,
                        const Prompt& prompt,
                        const Row& row,
                        std::chrono::milliseconds timeout) -> PredictResult {
    auto future = LaunchPredict(predictor, model, prompt, row);
    if (future.wait_for(timeout) != std::future_status::ready) {
        throw PredictTimeoutError("predict timed out after " + std::to_string(timeout.count()) + "ms");
    }
    return future.get();
}

} // namespace promptgrid
