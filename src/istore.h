#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "types.h"

namespace promptgrid {

/**
 * @brief Shared coordination store.
 *
 * Every operation that crosses a decision point (claim, complete, fail,
 * release, reset, reopen) is a single atomic operation of the store. Callers
 * never read-then-write.
 */
class IStore {
public:
    virtual ~IStore() = default;

    // --- Reference data ---

    // Returns the existing dataset id when `name` is already registered; rows are
    // only inserted on first registration.
    virtual auto RegisterDataset(const std::string& name, const std::vector<RowInput>& rows) -> long long = 0;
    virtual auto RegisterModel(const std::string& name, const std::string& family) -> long long = 0;
    virtual auto RegisterPrompt(const std::string& text) -> long long = 0;

    virtual auto GetDataset(long long dataset_id) -> std::optional<Dataset> = 0;
    virtual auto GetModel(long long model_id) -> std::optional<Model> = 0;
    virtual auto GetPrompt(long long prompt_id) -> std::optional<Prompt> = 0;

    // --- Task expansion ---

    // Creates the cell and one pending task per dataset row in one atomic step.
    // No-op (created=false) when the triple already exists.
    virtual auto RegisterWorkCell(long long model_id, long long prompt_id, long long dataset_id)
        -> CellRegistration = 0;

    // --- Worker protocol ---

    // Picks one available cell whose model family is in `families` and that has
    // a pending task, marks it in_use and increments its active worker count.
    // Cells whose open tasks are all in_progress are skipped. With join_active
    // set, falls back to an in_use cell that still has pending tasks.
    virtual auto ClaimEligibleCell(const std::set<std::string>& families, bool join_active)
        -> std::optional<WorkCell> = 0;

    // Moves up to `batch_size` pending tasks of the cell to in_progress.
    virtual auto ClaimTaskBatch(long long cell_id, int batch_size) -> std::vector<ClaimedTask> = 0;

    // Appends the prediction and marks the task done, only if the task is still
    // in_progress under `claimed_at`. Returns false when the claim was lost.
    virtual auto CompleteTask(const ClaimedTask& task, const PredictionRecord& prediction) -> bool = 0;

    // Records a failed predict attempt for a task still held under `claimed_at`.
    // Returns nullopt when the claim was lost.
    virtual auto FailTaskAttempt(const ClaimedTask& task, int max_retries, const std::string& error)
        -> std::optional<TaskResetOutcome> = 0;

    // Decrements the active worker count and decides done/available/in_use.
    virtual auto ReleaseCell(long long cell_id) -> CellStatus = 0;

    // --- Watchdog reconciliation ---

    virtual auto ListStaleTasks(std::chrono::seconds stale_threshold) -> std::vector<StaleTaskRef> = 0;

    // Compare-and-set on (task_id, claimed_at): returns nullopt if the task was
    // completed, failed or reclaimed since it was listed.
    virtual auto ResetStaleTask(const StaleTaskRef& ref, int max_retries) -> std::optional<TaskResetOutcome> = 0;

    virtual auto ListDoneCellsWithPendingTasks() -> std::vector<long long> = 0;

    // Moves a done cell with pending tasks back to available/in_use. Returns
    // nullopt when the cell is no longer done or has no pending task.
    virtual auto ReopenCell(long long cell_id) -> std::optional<CellStatus> = 0;

    // --- Reporting ---

    virtual auto GetCell(long long cell_id) -> std::optional<WorkCell> = 0;
    virtual auto FindCell(long long model_id, long long prompt_id, long long dataset_id)
        -> std::optional<WorkCell> = 0;
    virtual auto GetCellProgress(long long cell_id) -> std::optional<CellProgress> = 0;
    virtual auto ListTasks(long long cell_id) -> std::vector<RowTask> = 0;
    virtual auto ListFailedTasks(std::optional<long long> cell_id, int limit) -> std::vector<RowTask> = 0;
    virtual auto GetLatestPrediction(long long cell_id, long long row_id) -> std::optional<PredictionRecord> = 0;
};

} // namespace promptgrid
