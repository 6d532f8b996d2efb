#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <pqxx/pqxx>

#include "db_connection_manager.h"
#include "istore.h"

namespace promptgrid {

// Quoted PostgreSQL array literal for a text[] parameter, e.g. {"a","b,c"}.
auto ToPgTextArray(const std::set<std::string>& values) -> std::string;

/**
 * @brief PostgreSQL-backed store shared by all worker and watchdog processes.
 *
 * Claims use SELECT ... FOR UPDATE SKIP LOCKED so concurrent claimers never
 * pick the same row. Guarded writes (complete, fail, reset) compare the task's
 * claimed_at, compared at microsecond precision.
 */
class PgStore : public IStore {
public:
    explicit PgStore(const std::string& connection_string, size_t pool_size = 4);
    explicit PgStore(std::shared_ptr<DbConnectionManager> manager);
    PgStore(const PgStore&) = delete;
    auto operator=(const PgStore&) -> PgStore& = delete;
    ~PgStore() override = default;

    // Session setup applied to every pooled connection.
    static auto ConfigureSession(pqxx::connection& C) -> void;

    // Creates tables and indexes if they do not exist.
    auto EnsureSchema() -> void;

    auto GetConnectionManager() -> std::shared_ptr<DbConnectionManager> { return manager_; }

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

private:
    // Runs `fn` inside one transaction; logs failures with `err_code` and rethrows.
    template <typename Fn>
    auto InTransaction(const char* op, const char* err_code, Fn&& fn);

    // Locks the task row and applies the retry policy if still held under claimed_at.
    auto AbandonAttempt(pqxx::work& W, long long task_id, TimePoint claimed_at, int max_retries,
                        const std::string& error) -> std::optional<TaskResetOutcome>;

    std::shared_ptr<DbConnectionManager> manager_;
};

} // namespace promptgrid
