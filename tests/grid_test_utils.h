#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "in_memory_store.h"
#include "predictor.h"

namespace promptgrid {

// Puts the store into states the public protocol only reaches through races
// or crashes between statements.
class InMemoryStoreTestPeer {
public:
    static void ForceTaskStatus(InMemoryStore& store, long long task_id, TaskStatus status) {
        std::lock_guard<std::mutex> lk(store.mutex_);
        auto& t = store.tasks_.at(task_id);
        t.status = status;
        if (status != TaskStatus::IN_PROGRESS) {
            t.claimed_at.reset();
        }
    }

    static void ForceCell(InMemoryStore& store, long long cell_id, CellStatus status, int active_workers) {
        std::lock_guard<std::mutex> lk(store.mutex_);
        auto& c = store.cells_.at(cell_id);
        c.status = status;
        c.active_worker_count = active_workers;
    }
};

} // namespace promptgrid

namespace promptgrid::testing_support {

// Manually advanced clock for InMemoryStore.
class FakeClock {
public:
    explicit FakeClock(TimePoint start = TimePoint(std::chrono::hours(24 * 365 * 50))) : now_(start) {}

    auto Now() const -> TimePoint {
        std::lock_guard<std::mutex> lk(mutex_);
        return now_;
    }

    void Advance(std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lk(mutex_);
        now_ += d;
    }

    auto Fn() -> InMemoryStore::ClockFn {
        return [this]() { return Now(); };
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

inline auto MakeRows(int n, const std::string& prefix = "row") -> std::vector<RowInput> {
    std::vector<RowInput> rows;
    rows.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        rows.push_back({prefix + " " + std::to_string(i), i % 2 == 0 ? "positive" : "negative"});
    }
    return rows;
}

struct SeededCell {
    long long model_id = 0;
    long long prompt_id = 0;
    long long dataset_id = 0;
    long long cell_id = 0;
};

inline auto SeedCell(IStore& store,
                     int rows,
                     const std::string& family = "ollama",
                     const std::string& suffix = "") -> SeededCell {
    SeededCell s;
    s.dataset_id = store.RegisterDataset("dataset" + suffix, MakeRows(rows));
    s.model_id = store.RegisterModel("model-" + family + suffix, family);
    s.prompt_id = store.RegisterPrompt("Classify sentiment" + suffix + ": {text}");
    s.cell_id = store.RegisterWorkCell(s.model_id, s.prompt_id, s.dataset_id).cell_id;
    return s;
}

/**
 * @brief Predictor whose behavior is scripted per row content.
 */
class ScriptedPredictor : public IPredictor {
public:
    auto Predict(const Model& /*model*/, const Prompt& /*prompt*/, const Row& row) -> PredictResult override {
        calls_++;
        std::chrono::milliseconds delay{0};
        bool fail = false;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            fail = always_fail_ || failing_.count(row.content) > 0;
            delay = delay_;
            seen_.push_back(row.content);
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (fail) {
            throw std::runtime_error("backend unavailable");
        }
        return {row.expected_label, 1.5};
    }

    void FailFor(const std::string& content) {
        std::lock_guard<std::mutex> lk(mutex_);
        failing_.insert(content);
    }

    void FailAlways() {
        std::lock_guard<std::mutex> lk(mutex_);
        always_fail_ = true;
    }

    void SetDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lk(mutex_);
        delay_ = delay;
    }

    auto Calls() const -> int { return calls_.load(); }

    auto Seen() const -> std::vector<std::string> {
        std::lock_guard<std::mutex> lk(mutex_);
        return seen_;
    }

private:
    mutable std::mutex mutex_;
    std::set<std::string> failing_;
    std::vector<std::string> seen_;
    std::chrono::milliseconds delay_{0};
    bool always_fail_ = false;
    std::atomic<int> calls_{0};
};

} // namespace promptgrid::testing_support
