#include "in_memory_store.h"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace promptgrid {

InMemoryStore::InMemoryStore(ClockFn clock) : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = []() { return Clock::now(); };
    }
}

auto InMemoryStore::Now() const -> TimePoint {
    return clock_();
}

auto InMemoryStore::RegisterDataset(const std::string& name, const std::vector<RowInput>& rows) -> long long {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = dataset_by_name_.find(name);
    if (existing != dataset_by_name_.end()) {
        return existing->second;
    }

    Dataset ds;
    ds.dataset_id = next_id_++;
    ds.name = name;
    ds.row_count = static_cast<long>(rows.size());
    auto& row_ids = rows_by_dataset_[ds.dataset_id];
    for (const auto& in : rows) {
        Row r;
        r.row_id = next_id_++;
        r.dataset_id = ds.dataset_id;
        r.content = in.content;
        r.expected_label = in.expected_label;
        rows_[r.row_id] = r;
        row_ids.push_back(r.row_id);
    }
    datasets_[ds.dataset_id] = ds;
    dataset_by_name_[name] = ds.dataset_id;
    return ds.dataset_id;
}

auto InMemoryStore::RegisterModel(const std::string& name, const std::string& family) -> long long {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = model_by_name_.find(name);
    if (existing != model_by_name_.end()) {
        return existing->second;
    }
    Model m{next_id_++, name, family};
    models_[m.model_id] = m;
    model_by_name_[name] = m.model_id;
    return m.model_id;
}

auto InMemoryStore::RegisterPrompt(const std::string& text) -> long long {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = prompt_by_text_.find(text);
    if (existing != prompt_by_text_.end()) {
        return existing->second;
    }
    Prompt p{next_id_++, text};
    prompts_[p.prompt_id] = p;
    prompt_by_text_[text] = p.prompt_id;
    return p.prompt_id;
}

auto InMemoryStore::GetDataset(long long dataset_id) -> std::optional<Dataset> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = datasets_.find(dataset_id);
    if (it == datasets_.end()) { return std::nullopt; }
    return it->second;
}

auto InMemoryStore::GetModel(long long model_id) -> std::optional<Model> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = models_.find(model_id);
    if (it == models_.end()) { return std::nullopt; }
    return it->second;
}

auto InMemoryStore::GetPrompt(long long prompt_id) -> std::optional<Prompt> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = prompts_.find(prompt_id);
    if (it == prompts_.end()) { return std::nullopt; }
    return it->second;
}

auto InMemoryStore::RegisterWorkCell(long long model_id, long long prompt_id, long long dataset_id)
    -> CellRegistration {
    std::lock_guard<std::mutex> lock(mutex_);
    CellKey key{model_id, prompt_id, dataset_id};
    auto existing = cell_by_key_.find(key);
    if (existing != cell_by_key_.end()) {
        return {existing->second, false, static_cast<long>(tasks_by_cell_[existing->second].size())};
    }
    if (models_.count(model_id) == 0) {
        throw std::invalid_argument("Unknown model id " + std::to_string(model_id));
    }
    if (prompts_.count(prompt_id) == 0) {
        throw std::invalid_argument("Unknown prompt id " + std::to_string(prompt_id));
    }
    if (datasets_.count(dataset_id) == 0) {
        throw std::invalid_argument("Unknown dataset id " + std::to_string(dataset_id));
    }

    // Cell and tasks are published under the same lock hold, so no claimer can
    // see the cell before its full task set exists.
    WorkCell cell;
    cell.cell_id = next_id_++;
    cell.model_id = model_id;
    cell.prompt_id = prompt_id;
    cell.dataset_id = dataset_id;
    cell.status = CellStatus::AVAILABLE;
    cell.active_worker_count = 0;

    auto& task_ids = tasks_by_cell_[cell.cell_id];
    for (long long row_id : rows_by_dataset_[dataset_id]) {
        RowTask t;
        t.task_id = next_id_++;
        t.cell_id = cell.cell_id;
        t.row_id = row_id;
        t.status = TaskStatus::PENDING;
        t.retry_count = 0;
        tasks_[t.task_id] = t;
        task_ids.push_back(t.task_id);
    }
    cells_[cell.cell_id] = cell;
    cell_by_key_[key] = cell.cell_id;
    return {cell.cell_id, true, static_cast<long>(task_ids.size())};
}

auto InMemoryStore::CountOpenTasks(long long cell_id) const -> long {
    long open = 0;
    auto it = tasks_by_cell_.find(cell_id);
    if (it == tasks_by_cell_.end()) { return 0; }
    for (long long task_id : it->second) {
        const auto& t = tasks_.at(task_id);
        if (!TaskStateMachine::IsTerminal(t.status)) { ++open; }
    }
    return open;
}

auto InMemoryStore::HasPendingTask(long long cell_id) const -> bool {
    auto it = tasks_by_cell_.find(cell_id);
    if (it == tasks_by_cell_.end()) { return false; }
    return std::any_of(it->second.begin(), it->second.end(), [this](long long task_id) {
        return tasks_.at(task_id).status == TaskStatus::PENDING;
    });
}

auto InMemoryStore::ClaimEligibleCell(const std::set<std::string>& families, bool join_active)
    -> std::optional<WorkCell> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto eligible = [&](const WorkCell& c) {
        auto m = models_.find(c.model_id);
        return m != models_.end() && families.count(m->second.family) > 0;
    };

    WorkCell* chosen = nullptr;
    for (auto& [id, cell] : cells_) {
        if (cell.status == CellStatus::AVAILABLE && eligible(cell) && HasPendingTask(id)) {
            chosen = &cell;
            break;
        }
    }
    if (!chosen && join_active) {
        for (auto& [id, cell] : cells_) {
            if (cell.status == CellStatus::IN_USE && eligible(cell) && HasPendingTask(id)) {
                chosen = &cell;
                break;
            }
        }
    }
    if (!chosen) { return std::nullopt; }

    chosen->status = CellStatus::IN_USE;
    chosen->active_worker_count++;
    return *chosen;
}

auto InMemoryStore::ClaimTaskBatch(long long cell_id, int batch_size) -> std::vector<ClaimedTask> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ClaimedTask> claimed;
    auto it = tasks_by_cell_.find(cell_id);
    if (it == tasks_by_cell_.end() || batch_size <= 0) { return claimed; }

    auto now = Now();
    for (long long task_id : it->second) {
        if (static_cast<int>(claimed.size()) >= batch_size) { break; }
        auto& t = tasks_.at(task_id);
        if (t.status != TaskStatus::PENDING) { continue; }
        t.status = TaskStatus::IN_PROGRESS;
        t.claimed_at = now;

        ClaimedTask c;
        c.task_id = t.task_id;
        c.cell_id = t.cell_id;
        c.retry_count = t.retry_count;
        c.claimed_at = now;
        c.row = rows_.at(t.row_id);
        claimed.push_back(std::move(c));
    }
    return claimed;
}

auto InMemoryStore::HeldTask(const ClaimedTask& task) -> RowTask* {
    auto it = tasks_.find(task.task_id);
    if (it == tasks_.end()) { return nullptr; }
    auto& t = it->second;
    if (t.status != TaskStatus::IN_PROGRESS || !t.claimed_at || *t.claimed_at != task.claimed_at) {
        return nullptr;
    }
    return &t;
}

auto InMemoryStore::CompleteTask(const ClaimedTask& task, const PredictionRecord& prediction) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* t = HeldTask(task);
    if (!t) { return false; }

    const auto& cell = cells_.at(t->cell_id);
    PredictionRecord rec = prediction;
    rec.prediction_id = next_id_++;
    rec.cell_id = t->cell_id;
    rec.row_id = t->row_id;
    rec.model_id = cell.model_id;
    rec.prompt_id = cell.prompt_id;
    rec.dataset_id = cell.dataset_id;
    rec.created_at = Now();
    predictions_.push_back(std::move(rec));

    t->status = TaskStatus::DONE;
    t->last_error.clear();
    return true;
}

auto InMemoryStore::FailTaskAttempt(const ClaimedTask& task, int max_retries, const std::string& error)
    -> std::optional<TaskResetOutcome> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* t = HeldTask(task);
    if (!t) { return std::nullopt; }

    t->retry_count++;
    t->status = TaskStateMachine::StatusAfterFailedAttempt(t->retry_count, max_retries);
    t->claimed_at.reset();
    t->last_error = error;
    return TaskResetOutcome{t->status, t->retry_count};
}

auto InMemoryStore::ReleaseCell(long long cell_id) -> CellStatus {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cells_.find(cell_id);
    if (it == cells_.end()) {
        throw std::runtime_error("Cannot release unknown cell " + std::to_string(cell_id));
    }
    auto& cell = it->second;
    if (cell.active_worker_count <= 0) {
        spdlog::warn("Release of cell {} with no active workers", cell_id);
        cell.active_worker_count = 0;
    } else {
        cell.active_worker_count--;
    }
    cell.status = CellStateMachine::DecideRelease(cell.active_worker_count, CountOpenTasks(cell_id));
    return cell.status;
}

auto InMemoryStore::ListStaleTasks(std::chrono::seconds stale_threshold) -> std::vector<StaleTaskRef> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StaleTaskRef> out;
    auto now = Now();
    for (const auto& [id, t] : tasks_) {
        if (t.status == TaskStatus::IN_PROGRESS && t.claimed_at && now - *t.claimed_at > stale_threshold) {
            out.push_back({t.task_id, t.cell_id, *t.claimed_at});
        }
    }
    return out;
}

auto InMemoryStore::ResetStaleTask(const StaleTaskRef& ref, int max_retries) -> std::optional<TaskResetOutcome> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(ref.task_id);
    if (it == tasks_.end()) { return std::nullopt; }
    auto& t = it->second;
    if (t.status != TaskStatus::IN_PROGRESS || !t.claimed_at || *t.claimed_at != ref.claimed_at) {
        return std::nullopt;
    }
    t.retry_count++;
    t.status = TaskStateMachine::StatusAfterFailedAttempt(t.retry_count, max_retries);
    t.claimed_at.reset();
    t.last_error = "stale claim reclaimed by watchdog";
    return TaskResetOutcome{t.status, t.retry_count};
}

auto InMemoryStore::ListDoneCellsWithPendingTasks() -> std::vector<long long> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<long long> out;
    for (const auto& [id, cell] : cells_) {
        if (cell.status == CellStatus::DONE && HasPendingTask(id)) {
            out.push_back(id);
        }
    }
    return out;
}

auto InMemoryStore::ReopenCell(long long cell_id) -> std::optional<CellStatus> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cells_.find(cell_id);
    if (it == cells_.end() || it->second.status != CellStatus::DONE || !HasPendingTask(cell_id)) {
        return std::nullopt;
    }
    it->second.status = CellStateMachine::DecideReopen(it->second.active_worker_count);
    return it->second.status;
}

auto InMemoryStore::GetCell(long long cell_id) -> std::optional<WorkCell> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cells_.find(cell_id);
    if (it == cells_.end()) { return std::nullopt; }
    return it->second;
}

auto InMemoryStore::FindCell(long long model_id, long long prompt_id, long long dataset_id)
    -> std::optional<WorkCell> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cell_by_key_.find(CellKey{model_id, prompt_id, dataset_id});
    if (it == cell_by_key_.end()) { return std::nullopt; }
    return cells_.at(it->second);
}

auto InMemoryStore::GetCellProgress(long long cell_id) -> std::optional<CellProgress> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cells_.find(cell_id);
    if (it == cells_.end()) { return std::nullopt; }
    CellProgress p;
    p.cell = it->second;
    for (long long task_id : tasks_by_cell_[cell_id]) {
        switch (tasks_.at(task_id).status) {
            case TaskStatus::PENDING: p.pending++; break;
            case TaskStatus::IN_PROGRESS: p.in_progress++; break;
            case TaskStatus::DONE: p.done++; break;
            case TaskStatus::FAILED: p.failed++; break;
        }
    }
    return p;
}

auto InMemoryStore::ListTasks(long long cell_id) -> std::vector<RowTask> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RowTask> out;
    auto it = tasks_by_cell_.find(cell_id);
    if (it == tasks_by_cell_.end()) { return out; }
    for (long long task_id : it->second) {
        out.push_back(tasks_.at(task_id));
    }
    return out;
}

auto InMemoryStore::ListFailedTasks(std::optional<long long> cell_id, int limit) -> std::vector<RowTask> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RowTask> out;
    for (const auto& [id, t] : tasks_) {
        if (limit > 0 && static_cast<int>(out.size()) >= limit) { break; }
        if (t.status != TaskStatus::FAILED) { continue; }
        if (cell_id && t.cell_id != *cell_id) { continue; }
        out.push_back(t);
    }
    return out;
}

auto InMemoryStore::GetLatestPrediction(long long cell_id, long long row_id) -> std::optional<PredictionRecord> {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = predictions_.rbegin(); it != predictions_.rend(); ++it) {
        if (it->cell_id == cell_id && it->row_id == row_id) {
            return *it;
        }
    }
    return std::nullopt;
}

auto InMemoryStore::ListPredictions(long long cell_id, long long row_id) -> std::vector<PredictionRecord> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PredictionRecord> out;
    for (const auto& p : predictions_) {
        if (p.cell_id == cell_id && p.row_id == row_id) {
            out.push_back(p);
        }
    }
    return out;
}

} // namespace promptgrid
