#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "grid_config.h"
#include "istore.h"
#include "predictor.h"

namespace promptgrid {

struct WorkerStats {
    long cells_processed = 0;
    long batches = 0;
    long tasks_completed = 0;
    long tasks_requeued = 0;
    long tasks_failed = 0;
    long claims_lost = 0;
};

// Random lower-case UUID used as the worker identity in predictions and logs.
auto GenerateWorkerId() -> std::string;

/**
 * @brief One worker: claim a cell, drain it batch by batch, release it.
 *
 * The loop holds no state across cells besides counters; everything it needs
 * to resume after a crash lives in the store.
 */
class WorkerLoop {
public:
    WorkerLoop(std::shared_ptr<IStore> store,
               PredictorRegistry predictors,
               WorkerConfig config,
               std::string worker_id = "");

    /**
     * @brief Runs until the stop flag is observed between cells.
     *
     * When no cell is eligible the loop either returns (exit_when_idle) or waits
     * idle_poll before asking again.
     */
    void Run(const std::atomic<bool>* stop_flag);

    /**
     * @brief Claims one eligible cell and drains it.
     * @return false when no cell was eligible or the claimed cell yielded no
     *         task (lost to a racing worker); the caller treats both as idle.
     */
    auto RunOnce() -> bool;

    auto WorkerId() const -> const std::string& { return worker_id_; }
    auto Families() const -> const std::set<std::string>& { return families_; }
    auto Stats() const -> WorkerStats;

private:
    auto DrainCell(const WorkCell& cell) -> long;
    void ProcessBatch(const WorkCell& cell,
                      const Model& model,
                      const Prompt& prompt,
                      const std::shared_ptr<IPredictor>& predictor,
                      const std::vector<ClaimedTask>& batch);
    void RecordFailure(const ClaimedTask& task, const std::string& error_code, const std::string& error);
    void ReleaseCell(long long cell_id);

    std::shared_ptr<IStore> store_;
    PredictorRegistry predictors_;
    WorkerConfig config_;
    std::string worker_id_;
    std::set<std::string> families_;

    mutable std::mutex stats_mutex_;
    WorkerStats stats_;
};

} // namespace promptgrid
