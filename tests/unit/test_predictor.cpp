#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <thread>

#include "grid_test_utils.h"
#include "predictor.h"

namespace {

using namespace promptgrid;
using namespace promptgrid::testing_support;
using namespace std::chrono_literals;

// Blocks every call until Release().
class GatedPredictor : public IPredictor {
public:
    auto Predict(const Model&, const Prompt&, const Row& row) -> PredictResult override {
        gate_.wait();
        return {row.content, 1.0};
    }

    void Release() { open_.set_value(); }

private:
    std::promise<void> open_;
    std::shared_future<void> gate_ = open_.get_future().share();
};

auto WaitForIdlePredicts() -> bool {
    for (int i = 0; i < 200 && InFlightPredicts() > 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    return InFlightPredicts() == 0;
}

class InFlightLimit {
public:
    explicit InFlightLimit(size_t limit) : previous_(MaxInFlightPredicts()) { SetMaxInFlightPredicts(limit); }
    ~InFlightLimit() { SetMaxInFlightPredicts(previous_); }

private:
    size_t previous_;
};

TEST(PredictorTest, RenderPromptFillsPlaceholder) {
    Prompt p{1, "Review: {text}\nAgain: {text}\nSentiment?"};
    Row r{1, 1, "great movie", "positive"};
    EXPECT_EQ(RenderPrompt(p, r), "Review: great movie\nAgain: great movie\nSentiment?");
}

TEST(PredictorTest, RenderPromptAppendsWithoutPlaceholder) {
    Prompt p{1, "Classify the sentiment."};
    Row r{1, 1, "meh", ""};
    EXPECT_EQ(RenderPrompt(p, r), "Classify the sentiment.\n\nmeh");
}

TEST(PredictorTest, NormalizeLabel) {
    EXPECT_EQ(NormalizeLabel("Positive."), "positive");
    EXPECT_EQ(NormalizeLabel("\n\n  NEGATIVE!  \nbecause..."), "negative");
    EXPECT_EQ(NormalizeLabel("\"Neutral\""), "neutral");
    EXPECT_EQ(NormalizeLabel("'mixed'."), "mixed");
    EXPECT_EQ(NormalizeLabel("   \n \n"), "");
}

TEST(PredictorTest, RegistryLookup) {
    PredictorRegistry registry;
    registry.Register("ollama", std::make_shared<ScriptedPredictor>());
    EXPECT_NE(registry.Get("ollama"), nullptr);
    EXPECT_EQ(registry.Get("chat"), nullptr);
    EXPECT_EQ(registry.Families(), std::set<std::string>{"ollama"});
    EXPECT_THROW(registry.Register("chat", nullptr), std::invalid_argument);
}

TEST(PredictorTest, PredictWithTimeoutReturnsResult) {
    auto predictor = std::make_shared<ScriptedPredictor>();
    Row r{1, 1, "text", "positive"};
    auto result = PredictWithTimeout(predictor, Model{}, Prompt{}, r, 1000ms);
    EXPECT_EQ(result.label, "positive");
}

TEST(PredictorTest, PredictWithTimeoutPropagatesBackendError) {
    auto predictor = std::make_shared<ScriptedPredictor>();
    predictor->FailAlways();
    Row r{1, 1, "text", "positive"};
    EXPECT_THROW(PredictWithTimeout(predictor, Model{}, Prompt{}, r, 1000ms), std::runtime_error);
}

TEST(PredictorTest, PredictWithTimeoutGivesUpOnSlowBackend) {
    auto predictor = std::make_shared<ScriptedPredictor>();
    predictor->SetDelay(500ms);
    Row r{1, 1, "text", "positive"};

    auto begin = std::chrono::steady_clock::now();
    EXPECT_THROW(PredictWithTimeout(predictor, Model{}, Prompt{}, r, 50ms), PredictTimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 400ms);

    std::this_thread::sleep_for(600ms);
    EXPECT_EQ(predictor->Calls(), 1);
}

TEST(PredictorTest, InFlightCapRejectsCallsWhileBackendHangs) {
    ASSERT_TRUE(WaitForIdlePredicts());
    InFlightLimit limit(2);
    auto predictor = std::make_shared<GatedPredictor>();

    auto first = LaunchPredict(predictor, Model{}, Prompt{}, Row{1, 1, "a", ""});
    auto second = LaunchPredict(predictor, Model{}, Prompt{}, Row{2, 1, "b", ""});
    auto third = LaunchPredict(predictor, Model{}, Prompt{}, Row{3, 1, "c", ""});

    EXPECT_EQ(InFlightPredicts(), 2u);
    ASSERT_EQ(third.wait_for(0ms), std::future_status::ready);
    EXPECT_THROW(third.get(), PredictCapacityError);

    predictor->Release();
    EXPECT_EQ(first.get().label, "a");
    EXPECT_EQ(second.get().label, "b");
    EXPECT_EQ(InFlightPredicts(), 0u);

    // Slots are reusable once the hung calls return.
    EXPECT_EQ(LaunchPredict(predictor, Model{}, Prompt{}, Row{4, 1, "d", ""}).get().label, "d");
}

TEST(PredictorTest, InFlightLimitMustBePositive) {
    EXPECT_THROW(SetMaxInFlightPredicts(0), std::invalid_argument);
    EXPECT_EQ(MaxInFlightPredicts(), kDefaultMaxInFlightPredicts);
}

} // namespace
