#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

#include "istore.h"

namespace promptgrid {

/**
 * @brief Store kept in process memory behind a single mutex.
 *
 * Used for single-node deployments and as the reference store in tests. Every
 * public operation holds the mutex for its whole read-decide-write sequence,
 * which gives the same atomicity the PostgreSQL store gets from row locks.
 */
class InMemoryStore : public IStore {
public:
    friend class InMemoryStoreTestPeer;

    using ClockFn = std::function<TimePoint()>;

    explicit InMemoryStore(ClockFn clock = nullptr);
    ~InMemoryStore() override = default;
    InMemoryStore(const InMemoryStore&) = delete;
    auto operator=(const InMemoryStore&) -> InMemoryStore& = delete;

    auto RegisterDataset(const std::string& name, const std::vector<RowInput>& rows) -> long long override;
    auto RegisterModel(const std::string& name, const std::string& family) -> long long override;
    auto RegisterPrompt(const std::string& text) -> long long override;

    auto GetDataset(long long dataset_id) -> std::optional<Dataset> override;
    auto GetModel(long long model_id) -> std::optional<Model> override;
    auto GetPrompt(long long prompt_id) -> std::optional<Prompt> override;

    auto RegisterWorkCell(long long model_id, long long prompt_id, long long dataset_id)
        -> CellRegistration override;

    auto ClaimEligibleCell(const std::set<std::string>& families, bool join_active)
        -> std::optional<WorkCell> override;
    auto ClaimTaskBatch(long long cell_id, int batch_size) -> std::vector<ClaimedTask> override;
    auto CompleteTask(const ClaimedTask& task, const PredictionRecord& prediction) -> bool override;
    auto FailTaskAttempt(const ClaimedTask& task, int max_retries, const std::string& error)
        -> std::optional<TaskResetOutcome> override;
    auto ReleaseCell(long long cell_id) -> CellStatus override;

    auto ListStaleTasks(std::chrono::seconds stale_threshold) -> std::vector<StaleTaskRef> override;
    auto ResetStaleTask(const StaleTaskRef& ref, int max_retries) -> std::optional<TaskResetOutcome> override;
    auto ListDoneCellsWithPendingTasks() -> std::vector<long long> override;
    auto ReopenCell(long long cell_id) -> std::optional<CellStatus> override;

    auto GetCell(long long cell_id) -> std::optional<WorkCell> override;
    auto FindCell(long long model_id, long long prompt_id, long long dataset_id)
        -> std::optional<WorkCell> override;
    auto GetCellProgress(long long cell_id) -> std::optional<CellProgress> override;
    auto ListTasks(long long cell_id) -> std::vector<RowTask> override;
    auto ListFailedTasks(std::optional<long long> cell_id, int limit) -> std::vector<RowTask> override;
    auto GetLatestPrediction(long long cell_id, long long row_id) -> std::optional<PredictionRecord> override;

    // Full append-only prediction log for one (cell, row), oldest first.
    auto ListPredictions(long long cell_id, long long row_id) -> std::vector<PredictionRecord>;

private:
    using CellKey = std::tuple<long long, long long, long long>;

    auto Now() const -> TimePoint;
    auto CountOpenTasks(long long cell_id) const -> long;
    auto HasPendingTask(long long cell_id) const -> bool;
    auto HeldTask(const ClaimedTask& task) -> RowTask*;

    ClockFn clock_;
    mutable std::mutex mutex_;

    long long next_id_ = 1;
    std::map<long long, Dataset> datasets_;
    std::map<std::string, long long> dataset_by_name_;
    std::map<long long, Row> rows_;
    std::map<long long, std::vector<long long>> rows_by_dataset_;
    std::map<long long, Model> models_;
    std::map<std::string, long long> model_by_name_;
    std::map<long long, Prompt> prompts_;
    std::map<std::string, long long> prompt_by_text_;
    std::map<long long, WorkCell> cells_;
    std::map<CellKey, long long> cell_by_key_;
    std::map<long long, RowTask> tasks_;
    std::map<long long, std::vector<long long>> tasks_by_cell_;
    std::vector<PredictionRecord> predictions_;
};

} // namespace promptgrid
