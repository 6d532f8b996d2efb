#include "pg_store.h"

#include <algorithm>
#include <stdexcept>
#include <type_traits>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "obs/error_codes.h"

namespace promptgrid {

namespace {

constexpr const char* kSchemaSql = R"SQL(
CREATE TABLE IF NOT EXISTS datasets (
    dataset_id BIGSERIAL PRIMARY KEY,
    name TEXT NOT NULL UNIQUE,
    created_at TIMESTAMPTZ NOT NULL DEFAULT now()
);
CREATE TABLE IF NOT EXISTS rows (
    row_id BIGSERIAL PRIMARY KEY,
    dataset_id BIGINT NOT NULL REFERENCES datasets(dataset_id),
    content TEXT NOT NULL,
    expected_prediction TEXT
);
CREATE INDEX IF NOT EXISTS idx_rows_dataset ON rows (dataset_id);
CREATE TABLE IF NOT EXISTS models (
    model_id BIGSERIAL PRIMARY KEY,
    name TEXT NOT NULL UNIQUE,
    library TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS prompts (
    prompt_id BIGSERIAL PRIMARY KEY,
    text TEXT NOT NULL UNIQUE
);
CREATE TABLE IF NOT EXISTS model_prompt_dataset_status (
    cell_id BIGSERIAL PRIMARY KEY,
    model_id BIGINT NOT NULL REFERENCES models(model_id),
    prompt_id BIGINT NOT NULL REFERENCES prompts(prompt_id),
    dataset_id BIGINT NOT NULL REFERENCES datasets(dataset_id),
    status TEXT NOT NULL DEFAULT 'available' CHECK (status IN ('available', 'in_use', 'done')),
    active_worker_count INTEGER NOT NULL DEFAULT 0 CHECK (active_worker_count >= 0),
    updated_at TIMESTAMPTZ NOT NULL DEFAULT now(),
    UNIQUE (model_id, prompt_id, dataset_id)
);
CREATE TABLE IF NOT EXISTS prediction_status (
    task_id BIGSERIAL PRIMARY KEY,
    cell_id BIGINT NOT NULL REFERENCES model_prompt_dataset_status(cell_id),
    row_id BIGINT NOT NULL REFERENCES rows(row_id),
    status TEXT NOT NULL DEFAULT 'pending' CHECK (status IN ('pending', 'in_progress', 'done', 'failed')),
    retry_count INTEGER NOT NULL DEFAULT 0,
    claimed_at TIMESTAMPTZ,
    last_error TEXT,
    updated_at TIMESTAMPTZ NOT NULL DEFAULT now(),
    UNIQUE (cell_id, row_id)
);
CREATE INDEX IF NOT EXISTS idx_prediction_status_cell ON prediction_status (cell_id, status);
CREATE INDEX IF NOT EXISTS idx_prediction_status_claimed ON prediction_status (claimed_at)
    WHERE status = 'in_progress';
CREATE TABLE IF NOT EXISTS predictions (
    prediction_id BIGSERIAL PRIMARY KEY,
    cell_id BIGINT NOT NULL REFERENCES model_prompt_dataset_status(cell_id),
    row_id BIGINT NOT NULL REFERENCES rows(row_id),
    model_id BIGINT NOT NULL,
    prompt_id BIGINT NOT NULL,
    dataset_id BIGINT NOT NULL,
    prediction TEXT NOT NULL,
    latency_ms DOUBLE PRECISION NOT NULL,
    worker_id TEXT,
    created_at TIMESTAMPTZ NOT NULL DEFAULT clock_timestamp()
);
CREATE INDEX IF NOT EXISTS idx_predictions_cell_row ON predictions (cell_id, row_id, prediction_id DESC);
)SQL";

// claimed_at is exchanged with clients as integer epoch microseconds so the
// compare-and-set guard compares exactly what the claim returned.
auto ToMicros(TimePoint tp) -> long long {
    return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

auto FromMicros(long long us) -> TimePoint {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(us)));
}

auto ParseCell(const pqxx::row& row) -> WorkCell {
    WorkCell c;
    c.cell_id = row["cell_id"].as<long long>();
    c.model_id = row["model_id"].as<long long>();
    c.prompt_id = row["prompt_id"].as<long long>();
    c.dataset_id = row["dataset_id"].as<long long>();
    c.status = StringToCellStatus(row["status"].as<std::string>());
    c.active_worker_count = row["active_worker_count"].as<int>();
    return c;
}

auto ParseTask(const pqxx::row& row) -> RowTask {
    RowTask t;
    t.task_id = row["task_id"].as<long long>();
    t.cell_id = row["cell_id"].as<long long>();
    t.row_id = row["row_id"].as<long long>();
    t.status = StringToTaskStatus(row["status"].as<std::string>());
    t.retry_count = row["retry_count"].as<int>();
    if (!row["claimed_at_us"].is_null()) {
        t.claimed_at = FromMicros(row["claimed_at_us"].as<long long>());
    }
    t.last_error = row["last_error"].is_null() ? "" : row["last_error"].as<std::string>();
    return t;
}

constexpr const char* kCellColumns = "cell_id, model_id, prompt_id, dataset_id, status, active_worker_count";
constexpr const char* kTaskColumns =
    "task_id, cell_id, row_id, status, retry_count, "
    "(EXTRACT(EPOCH FROM claimed_at) * 1000000)::bigint AS claimed_at_us, last_error";

} // namespace

auto ToPgTextArray(const std::set<std::string>& values) -> std::string {
    std::string out = "{";
    for (const auto& v : values) {
        if (out.size() > 1) out += ",";
        out += '"';
        for (char c : v) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    out += "}";
    return out;
}

PgStore::PgStore(const std::string& connection_string, size_t pool_size)
    : manager_(std::make_shared<PooledDbConnectionManager>(
          connection_string, pool_size, std::chrono::seconds(5), &PgStore::ConfigureSession)) {}

PgStore::PgStore(std::shared_ptr<DbConnectionManager> manager) : manager_(std::move(manager)) {}

auto PgStore::ConfigureSession(pqxx::connection& C) -> void {
    pqxx::nontransaction N(C);
    N.exec("SET application_name = 'promptgrid'");
}

template <typename Fn>
auto PgStore::InTransaction(const char* op, const char* err_code, Fn&& fn) {
    try {
        auto conn = manager_->GetConnection();
        pqxx::work W(*conn);
        if constexpr (std::is_void_v<decltype(fn(W))>) {
            fn(W);
            W.commit();
        } else {
            auto result = fn(W);
            W.commit();
            return result;
        }
    } catch (const std::invalid_argument&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("[{}] {} failed: {}", err_code, op, e.what());
        throw;
    }
}

auto PgStore::EnsureSchema() -> void {
    InTransaction("EnsureSchema", obs::kErrDbQueryFailed, [](pqxx::work& W) {
        W.exec(kSchemaSql);
    });
    spdlog::info("Ensured promptgrid schema exists.");
}

auto PgStore::RegisterDataset(const std::string& name, const std::vector<RowInput>& rows) -> long long {
    return InTransaction("RegisterDataset", obs::kErrDbInsertFailed, [&](pqxx::work& W) -> long long {
        auto inserted = W.exec_params(
            "INSERT INTO datasets (name) VALUES ($1) ON CONFLICT (name) DO NOTHING RETURNING dataset_id", name);
        if (inserted.empty()) {
            return W.exec_params("SELECT dataset_id FROM datasets WHERE name = $1", name)[0][0].as<long long>();
        }
        auto dataset_id = inserted[0][0].as<long long>();

        auto stream = pqxx::stream_to::table(W, {"rows"}, {"dataset_id", "content", "expected_prediction"});
        for (const auto& r : rows) {
            std::optional<std::string> expected;
            if (!r.expected_label.empty()) { expected = r.expected_label; }
            stream << std::make_tuple(dataset_id, r.content, expected);
        }
        stream.complete();
        spdlog::info("Registered dataset '{}' (id={}) with {} rows.", name, dataset_id, rows.size());
        return dataset_id;
    });
}

auto PgStore::RegisterModel(const std::string& name, const std::string& family) -> long long {
    return InTransaction("RegisterModel", obs::kErrDbInsertFailed, [&](pqxx::work& W) -> long long {
        auto inserted = W.exec_params(
            "INSERT INTO models (name, library) VALUES ($1, $2) ON CONFLICT (name) DO NOTHING RETURNING model_id",
            name, family);
        if (!inserted.empty()) { return inserted[0][0].as<long long>(); }
        return W.exec_params("SELECT model_id FROM models WHERE name = $1", name)[0][0].as<long long>();
    });
}

auto PgStore::RegisterPrompt(const std::string& text) -> long long {
    return InTransaction("RegisterPrompt", obs::kErrDbInsertFailed, [&](pqxx::work& W) -> long long {
        auto inserted = W.exec_params(
            "INSERT INTO prompts (text) VALUES ($1) ON CONFLICT (text) DO NOTHING RETURNING prompt_id", text);
        if (!inserted.empty()) { return inserted[0][0].as<long long>(); }
        return W.exec_params("SELECT prompt_id FROM prompts WHERE text = $1", text)[0][0].as<long long>();
    });
}

auto PgStore::GetDataset(long long dataset_id) -> std::optional<Dataset> {
    return InTransaction("GetDataset", obs::kErrDbQueryFailed, [&](pqxx::work& W) -> std::optional<Dataset> {
        auto res = W.exec_params(
            "SELECT d.dataset_id, d.name, (SELECT COUNT(*) FROM rows r WHERE r.dataset_id = d.dataset_id) "
            "FROM datasets d WHERE d.dataset_id = $1", dataset_id);
        if (res.empty()) { return std::nullopt; }
        Dataset d;
        d.dataset_id = res[0][0].as<long long>();
        d.name = res[0][1].as<std::string>();
        d.row_count = res[0][2].as<long>();
        return d;
    });
}

auto PgStore::GetModel(long long model_id) -> std::optional<Model> {
    return InTransaction("GetModel", obs::kErrDbQueryFailed, [&](pqxx::work& W) -> std::optional<Model> {
        auto res = W.exec_params("SELECT model_id, name, library FROM models WHERE model_id = $1", model_id);
        if (res.empty()) { return std::nullopt; }
        return Model{res[0][0].as<long long>(), res[0][1].as<std::string>(), res[0][2].as<std::string>()};
    });
}

auto PgStore::GetPrompt(long long prompt_id) -> std::optional<Prompt> {
    return InTransaction("GetPrompt", obs::kErrDbQueryFailed, [&](pqxx::work& W) -> std::optional<Prompt> {
        auto res = W.exec_params("SELECT prompt_id, text FROM prompts WHERE prompt_id = $1", prompt_id);
        if (res.empty()) { return std::nullopt; }
        return Prompt{res[0][0].as<long long>(), res[0][1].as<std::string>()};
    });
}

auto PgStore::RegisterWorkCell(long long model_id, long long prompt_id, long long dataset_id) -> CellRegistration {
    return InTransaction("RegisterWorkCell", obs::kErrDbInsertFailed, [&](pqxx::work& W) -> CellRegistration {
        auto refs = W.exec_params(
            "SELECT EXISTS (SELECT 1 FROM models WHERE model_id = $1), "
            "EXISTS (SELECT 1 FROM prompts WHERE prompt_id = $2), "
            "EXISTS (SELECT 1 FROM datasets WHERE dataset_id = $3)",
            model_id, prompt_id, dataset_id);
        if (!refs[0][0].as<bool>()) {
            throw std::invalid_argument("Unknown model id " + std::to_string(model_id));
        }
        if (!refs[0][1].as<bool>()) {
            throw std::invalid_argument("Unknown prompt id " + std::to_string(prompt_id));
        }
        if (!refs[0][2].as<bool>()) {
            throw std::invalid_argument("Unknown dataset id " + std::to_string(dataset_id));
        }

        auto inserted = W.exec_params(
            "INSERT INTO model_prompt_dataset_status (model_id, prompt_id, dataset_id, status, active_worker_count) "
            "VALUES ($1, $2, $3, 'available', 0) "
            "ON CONFLICT (model_id, prompt_id, dataset_id) DO NOTHING RETURNING cell_id",
            model_id, prompt_id, dataset_id);
        if (inserted.empty()) {
            auto existing = W.exec_params(
                "SELECT c.cell_id, (SELECT COUNT(*) FROM prediction_status t WHERE t.cell_id = c.cell_id) "
                "FROM model_prompt_dataset_status c "
                "WHERE c.model_id = $1 AND c.prompt_id = $2 AND c.dataset_id = $3",
                model_id, prompt_id, dataset_id);
            return {existing[0][0].as<long long>(), false, existing[0][1].as<long>()};
        }

        // Tasks are inserted in the same transaction, so the cell only becomes
        // visible to claimers together with its full task set.
        auto cell_id = inserted[0][0].as<long long>();
        auto tasks = W.exec_params(
            "INSERT INTO prediction_status (cell_id, row_id, status, retry_count) "
            "SELECT $1, row_id, 'pending', 0 FROM rows WHERE dataset_id = $2 ORDER BY row_id",
            cell_id, dataset_id);
        return {cell_id, true, static_cast<long>(tasks.affected_rows())};
    });
}

auto PgStore::ClaimEligibleCell(const std::set<std::string>& families, bool join_active) -> std::optional<WorkCell> {
    if (families.empty()) { return std::nullopt; }
    return InTransaction("ClaimEligibleCell", obs::kErrClaimFailed, [&](pqxx::work& W) -> std::optional<WorkCell> {
        auto res = W.exec_params(
            "WITH pick AS ("
            "  SELECT c.cell_id FROM model_prompt_dataset_status c "
            "  JOIN models m ON m.model_id = c.model_id "
            "  WHERE m.library = ANY($1::text[]) "
            "    AND (c.status = 'available' OR ($2 AND c.status = 'in_use')) "
            "    AND EXISTS (SELECT 1 FROM prediction_status t "
            "                WHERE t.cell_id = c.cell_id AND t.status = 'pending') "
            "  ORDER BY (c.status = 'available') DESC, c.cell_id "
            "  LIMIT 1 FOR UPDATE OF c SKIP LOCKED"
            ") "
            "UPDATE model_prompt_dataset_status c "
            "SET status = 'in_use', active_worker_count = c.active_worker_count + 1, updated_at = now() "
            "FROM pick WHERE c.cell_id = pick.cell_id "
            "RETURNING c.cell_id, c.model_id, c.prompt_id, c.dataset_id, c.status, c.active_worker_count",
            ToPgTextArray(families), join_active);
        if (res.empty()) { return std::nullopt; }
        return ParseCell(res[0]);
    });
}

auto PgStore::ClaimTaskBatch(long long cell_id, int batch_size) -> std::vector<ClaimedTask> {
    if (batch_size <= 0) { return {}; }
    return InTransaction("ClaimTaskBatch", obs::kErrClaimFailed, [&](pqxx::work& W) {
        auto res = W.exec_params(
            "WITH pick AS ("
            "  SELECT task_id FROM prediction_status "
            "  WHERE cell_id = $1 AND status = 'pending' "
            "  ORDER BY task_id LIMIT $2 FOR UPDATE SKIP LOCKED"
            ") "
            "UPDATE prediction_status t "
            "SET status = 'in_progress', claimed_at = now(), updated_at = now() "
            "FROM pick, rows r "
            "WHERE t.task_id = pick.task_id AND r.row_id = t.row_id "
            "RETURNING t.task_id, t.cell_id, t.retry_count, "
            "  (EXTRACT(EPOCH FROM t.claimed_at) * 1000000)::bigint AS claimed_at_us, "
            "  r.row_id, r.dataset_id, r.content, r.expected_prediction",
            cell_id, batch_size);

        std::vector<ClaimedTask> out;
        out.reserve(res.size());
        for (const auto& row : res) {
            ClaimedTask c;
            c.task_id = row["task_id"].as<long long>();
            c.cell_id = row["cell_id"].as<long long>();
            c.retry_count = row["retry_count"].as<int>();
            c.claimed_at = FromMicros(row["claimed_at_us"].as<long long>());
            c.row.row_id = row["row_id"].as<long long>();
            c.row.dataset_id = row["dataset_id"].as<long long>();
            c.row.content = row["content"].as<std::string>();
            c.row.expected_label = row["expected_prediction"].is_null() ? "" : row["expected_prediction"].as<std::string>();
            out.push_back(std::move(c));
        }
        std::sort(out.begin(), out.end(), [](const ClaimedTask& a, const ClaimedTask& b) {
            return a.task_id < b.task_id;
        });
        return out;
    });
}

auto PgStore::CompleteTask(const ClaimedTask& task, const PredictionRecord& prediction) -> bool {
    return InTransaction("CompleteTask", obs::kErrDbInsertFailed, [&](pqxx::work& W) -> bool {
        auto updated = W.exec_params(
            "UPDATE prediction_status SET status = 'done', last_error = NULL, updated_at = now() "
            "WHERE task_id = $1 AND status = 'in_progress' "
            "  AND (EXTRACT(EPOCH FROM claimed_at) * 1000000)::bigint = $2 "
            "RETURNING cell_id, row_id",
            task.task_id, ToMicros(task.claimed_at));
        if (updated.empty()) { return false; }

        W.exec_params(
            "INSERT INTO predictions (cell_id, row_id, model_id, prompt_id, dataset_id, prediction, latency_ms, worker_id) "
            "SELECT c.cell_id, $2, c.model_id, c.prompt_id, c.dataset_id, $3, $4, $5 "
            "FROM model_prompt_dataset_status c WHERE c.cell_id = $1",
            updated[0][0].as<long long>(), updated[0][1].as<long long>(),
            prediction.label, prediction.latency_ms, prediction.worker_id);
        return true;
    });
}

auto PgStore::AbandonAttempt(pqxx::work& W, long long task_id, TimePoint claimed_at, int max_retries,
                             const std::string& error) -> std::optional<TaskResetOutcome> {
    auto locked = W.exec_params(
        "SELECT retry_count FROM prediction_status "
        "WHERE task_id = $1 AND status = 'in_progress' "
        "  AND (EXTRACT(EPOCH FROM claimed_at) * 1000000)::bigint = $2 "
        "FOR UPDATE",
        task_id, ToMicros(claimed_at));
    if (locked.empty()) { return std::nullopt; }

    TaskResetOutcome outcome;
    outcome.retry_count = locked[0][0].as<int>() + 1;
    outcome.status = TaskStateMachine::StatusAfterFailedAttempt(outcome.retry_count, max_retries);
    W.exec_params(
        "UPDATE prediction_status SET status = $2, retry_count = $3, claimed_at = NULL, "
        "last_error = $4, updated_at = now() WHERE task_id = $1",
        task_id, TaskStatusToString(outcome.status), outcome.retry_count, error);
    return outcome;
}

auto PgStore::FailTaskAttempt(const ClaimedTask& task, int max_retries, const std::string& error)
    -> std::optional<TaskResetOutcome> {
    return InTransaction("FailTaskAttempt", obs::kErrDbQueryFailed, [&](pqxx::work& W) {
        return AbandonAttempt(W, task.task_id, task.claimed_at, max_retries, error);
    });
}

auto PgStore::ReleaseCell(long long cell_id) -> CellStatus {
    return InTransaction("ReleaseCell", obs::kErrReleaseFailed, [&](pqxx::work& W) -> CellStatus {
        auto locked = W.exec_params(
            "SELECT active_worker_count FROM model_prompt_dataset_status WHERE cell_id = $1 FOR UPDATE", cell_id);
        if (locked.empty()) {
            throw std::runtime_error("Cannot release unknown cell " + std::to_string(cell_id));
        }
        int active = locked[0][0].as<int>();
        if (active <= 0) {
            spdlog::warn("Release of cell {} with no active workers", cell_id);
        }
        int active_after = active > 0 ? active - 1 : 0;

        auto open = W.exec_params(
            "SELECT COUNT(*) FROM prediction_status "
            "WHERE cell_id = $1 AND status IN ('pending', 'in_progress')", cell_id)[0][0].as<long>();
        auto status = CellStateMachine::DecideRelease(active_after, open);

        W.exec_params(
            "UPDATE model_prompt_dataset_status SET status = $2, active_worker_count = $3, updated_at = now() "
            "WHERE cell_id = $1",
            cell_id, CellStatusToString(status), active_after);
        return status;
    });
}

auto PgStore::ListStaleTasks(std::chrono::seconds stale_threshold) -> std::vector<StaleTaskRef> {
    return InTransaction("ListStaleTasks", obs::kErrDbQueryFailed, [&](pqxx::work& W) {
        auto res = W.exec_params(
            "SELECT task_id, cell_id, (EXTRACT(EPOCH FROM claimed_at) * 1000000)::bigint "
            "FROM prediction_status "
            "WHERE status = 'in_progress' AND now() - claimed_at > make_interval(secs => $1) "
            "ORDER BY claimed_at",
            static_cast<double>(stale_threshold.count()));
        std::vector<StaleTaskRef> out;
        out.reserve(res.size());
        for (const auto& row : res) {
            out.push_back({row[0].as<long long>(), row[1].as<long long>(), FromMicros(row[2].as<long long>())});
        }
        return out;
    });
}

auto PgStore::ResetStaleTask(const StaleTaskRef& ref, int max_retries) -> std::optional<TaskResetOutcome> {
    return InTransaction("ResetStaleTask", obs::kErrDbQueryFailed, [&](pqxx::work& W) {
        return AbandonAttempt(W, ref.task_id, ref.claimed_at, max_retries, "stale claim reclaimed by watchdog");
    });
}

auto PgStore::ListDoneCellsWithPendingTasks() -> std::vector<long long> {
    return InTransaction("ListDoneCellsWithPendingTasks", obs::kErrDbQueryFailed, [&](pqxx::work& W) {
        auto res = W.exec(
            "SELECT c.cell_id FROM model_prompt_dataset_status c "
            "WHERE c.status = 'done' AND EXISTS ("
            "  SELECT 1 FROM prediction_status t WHERE t.cell_id = c.cell_id AND t.status = 'pending') "
            "ORDER BY c.cell_id");
        std::vector<long long> out;
        out.reserve(res.size());
        for (const auto& row : res) {
            out.push_back(row[0].as<long long>());
        }
        return out;
    });
}

auto PgStore::ReopenCell(long long cell_id) -> std::optional<CellStatus> {
    return InTransaction("ReopenCell", obs::kErrDbQueryFailed, [&](pqxx::work& W) -> std::optional<CellStatus> {
        auto locked = W.exec_params(
            "SELECT active_worker_count FROM model_prompt_dataset_status "
            "WHERE cell_id = $1 AND status = 'done' FOR UPDATE", cell_id);
        if (locked.empty()) { return std::nullopt; }

        auto has_pending = W.exec_params(
            "SELECT EXISTS (SELECT 1 FROM prediction_status WHERE cell_id = $1 AND status = 'pending')",
            cell_id)[0][0].as<bool>();
        if (!has_pending) { return std::nullopt; }

        auto status = CellStateMachine::DecideReopen(locked[0][0].as<int>());
        W.exec_params(
            "UPDATE model_prompt_dataset_status SET status = $2, updated_at = now() WHERE cell_id = $1",
            cell_id, CellStatusToString(status));
        return status;
    });
}

auto PgStore::GetCell(long long cell_id) -> std::optional<WorkCell> {
    return InTransaction("GetCell", obs::kErrDbQueryFailed, [&](pqxx::work& W) -> std::optional<WorkCell> {
        auto res = W.exec_params(
            fmt::format("SELECT {} FROM model_prompt_dataset_status WHERE cell_id = $1", kCellColumns), cell_id);
        if (res.empty()) { return std::nullopt; }
        return ParseCell(res[0]);
    });
}

auto PgStore::FindCell(long long model_id, long long prompt_id, long long dataset_id) -> std::optional<WorkCell> {
    return InTransaction("FindCell", obs::kErrDbQueryFailed, [&](pqxx::work& W) -> std::optional<WorkCell> {
        auto res = W.exec_params(
            fmt::format("SELECT {} FROM model_prompt_dataset_status "
                        "WHERE model_id = $1 AND prompt_id = $2 AND dataset_id = $3", kCellColumns),
            model_id, prompt_id, dataset_id);
        if (res.empty()) { return std::nullopt; }
        return ParseCell(res[0]);
    });
}

auto PgStore::GetCellProgress(long long cell_id) -> std::optional<CellProgress> {
    return InTransaction("GetCellProgress", obs::kErrDbQueryFailed, [&](pqxx::work& W) -> std::optional<CellProgress> {
        auto cell = W.exec_params(
            fmt::format("SELECT {} FROM model_prompt_dataset_status WHERE cell_id = $1", kCellColumns), cell_id);
        if (cell.empty()) { return std::nullopt; }

        CellProgress p;
        p.cell = ParseCell(cell[0]);
        auto counts = W.exec_params(
            "SELECT status, COUNT(*) FROM prediction_status WHERE cell_id = $1 GROUP BY status", cell_id);
        for (const auto& row : counts) {
            auto n = row[1].as<long>();
            switch (StringToTaskStatus(row[0].as<std::string>())) {
                case TaskStatus::PENDING: p.pending = n; break;
                case TaskStatus::IN_PROGRESS: p.in_progress = n; break;
                case TaskStatus::DONE: p.done = n; break;
                case TaskStatus::FAILED: p.failed = n; break;
            }
        }
        return p;
    });
}

auto PgStore::ListTasks(long long cell_id) -> std::vector<RowTask> {
    return InTransaction("ListTasks", obs::kErrDbQueryFailed, [&](pqxx::work& W) {
        auto res = W.exec_params(
            fmt::format("SELECT {} FROM prediction_status WHERE cell_id = $1 ORDER BY task_id", kTaskColumns),
            cell_id);
        std::vector<RowTask> out;
        out.reserve(res.size());
        for (const auto& row : res) {
            out.push_back(ParseTask(row));
        }
        return out;
    });
}

auto PgStore::ListFailedTasks(std::optional<long long> cell_id, int limit) -> std::vector<RowTask> {
    return InTransaction("ListFailedTasks", obs::kErrDbQueryFailed, [&](pqxx::work& W) {
        auto res = W.exec_params(
            fmt::format("SELECT {} FROM prediction_status "
                        "WHERE status = 'failed' AND ($1::bigint IS NULL OR cell_id = $1) "
                        "ORDER BY task_id LIMIT $2", kTaskColumns),
            cell_id, limit > 0 ? limit : 1000);
        std::vector<RowTask> out;
        out.reserve(res.size());
        for (const auto& row : res) {
            out.push_back(ParseTask(row));
        }
        return out;
    });
}

auto PgStore::GetLatestPrediction(long long cell_id, long long row_id) -> std::optional<PredictionRecord> {
    return InTransaction("GetLatestPrediction", obs::kErrDbQueryFailed,
                         [&](pqxx::work& W) -> std::optional<PredictionRecord> {
        auto res = W.exec_params(
            "SELECT prediction_id, cell_id, row_id, model_id, prompt_id, dataset_id, prediction, latency_ms, "
            "  COALESCE(worker_id, ''), (EXTRACT(EPOCH FROM created_at) * 1000000)::bigint "
            "FROM predictions WHERE cell_id = $1 AND row_id = $2 "
            "ORDER BY prediction_id DESC LIMIT 1",
            cell_id, row_id);
        if (res.empty()) { return std::nullopt; }
        const auto& row = res[0];
        PredictionRecord p;
        p.prediction_id = row[0].as<long long>();
        p.cell_id = row[1].as<long long>();
        p.row_id = row[2].as<long long>();
        p.model_id = row[3].as<long long>();
        p.prompt_id = row[4].as<long long>();
        p.dataset_id = row[5].as<long long>();
        p.label = row[6].as<std::string>();
        p.latency_ms = row[7].as<double>();
        p.worker_id = row[8].as<std::string>();
        p.created_at = FromMicros(row[9].as<long long>());
        return p;
    });
}

} // namespace promptgrid
