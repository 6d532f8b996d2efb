#include "worker_loop.h"

#include <array>
#include <future>
#include <stdexcept>
#include <thread>

#include <spdlog/spdlog.h>
#include <uuid/uuid.h>

#include "obs/context.h"
#include "obs/error_codes.h"
#include "obs/logging.h"
#include "obs/metrics.h"

namespace promptgrid {

namespace {

constexpr auto kComponent = "worker";
constexpr auto kStopPollSlice = std::chrono::milliseconds(100);

auto ElapsedMs(std::chrono::steady_clock::time_point start) -> double {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

auto GenerateWorkerId() -> std::string {
    uuid_t binuuid;
    uuid_generate_random(binuuid);
    std::array<char, 37> uuid{};
    uuid_unparse_lower(binuuid, uuid.data());
    return {uuid.data()};
}

WorkerLoop::WorkerLoop(std::shared_ptr<IStore> store,
                       PredictorRegistry predictors,
                       WorkerConfig config,
                       std::string worker_id)
    : store_(std::move(store)),
      predictors_(std::move(predictors)),
      config_(std::move(config)),
      worker_id_(worker_id.empty() ? GenerateWorkerId() : std::move(worker_id)) {
    if (!store_) {
        throw std::invalid_argument("WorkerLoop requires a store");
    }
    if (config_.batch_size <= 0) {
        throw std::invalid_argument("Worker batch size must be positive");
    }
    families_ = config_.families.empty() ? predictors_.Families() : config_.families;
    if (families_.empty()) {
        throw std::invalid_argument("Worker declares no model families");
    }
    for (const auto& family : families_) {
        if (!predictors_.Get(family)) {
            obs::LogEvent(obs::LogLevel::Error, "backend_missing", kComponent,
                          {{"error_code", obs::kErrPredictBackendMissing}, {"family", family}});
            throw std::invalid_argument("No predictor registered for family '" + family + "'");
        }
    }
}

auto WorkerLoop::Stats() const -> WorkerStats {
    std::lock_guard<std::mutex> lk(stats_mutex_);
    return stats_;
}

void WorkerLoop::Run(const std::atomic<bool>* stop_flag) {
    obs::Context ctx;
    ctx.worker_id = worker_id_;
    obs::ScopedContext scope(ctx);

    spdlog::info("Worker {} started (families={}, batch_size={}, timeout={}s)",
                 worker_id_, families_.size(), config_.batch_size, config_.predict_timeout.count());

    auto stop_requested = [stop_flag]() { return stop_flag != nullptr && stop_flag->load(); };

    while (!stop_requested()) {
        bool worked = false;
        try {
            worked = RunOnce();
        } catch (const std::exception& e) {
            obs::LogEvent(obs::LogLevel::Error, "worker_iteration_failed", kComponent,
                          {{"error_code", obs::kErrInternal}, {"error", e.what()}});
            obs::EmitCounter("worker_errors_total", 1, "errors", kComponent);
        }
        if (worked) {
            continue;
        }
        if (config_.exit_when_idle) {
            spdlog::info("Worker {} found no eligible cell, exiting", worker_id_);
            break;
        }
        auto deadline = std::chrono::steady_clock::now() + config_.idle_poll;
        while (!stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kStopPollSlice);
        }
    }

    auto stats = Stats();
    spdlog::info("Worker {} stopped: cells={} completed={} requeued={} failed={} lost={}",
                 worker_id_, stats.cells_processed, stats.tasks_completed, stats.tasks_requeued,
                 stats.tasks_failed, stats.claims_lost);
}

auto WorkerLoop::RunOnce() -> bool {
    std::optional<WorkCell> cell;
    try {
        cell = store_->ClaimEligibleCell(families_, config_.join_active_cells);
    } catch (const std::exception& e) {
        obs::LogEvent(obs::LogLevel::Error, "cell_claim_failed", kComponent,
                      {{"error_code", obs::kErrClaimFailed}, {"error", e.what()}});
        throw;
    }
    if (!cell) {
        return false;
    }

    obs::Context ctx = obs::HasContext() ? obs::GetContext() : obs::Context{};
    ctx.worker_id = worker_id_;
    ctx.cell_id = std::to_string(cell->cell_id);
    ctx.model_id = std::to_string(cell->model_id);
    ctx.prompt_id = std::to_string(cell->prompt_id);
    ctx.dataset_id = std::to_string(cell->dataset_id);
    obs::ScopedContext scope(ctx);

    obs::LogEvent(obs::LogLevel::Info, "cell_claimed", kComponent,
                  {{"active_worker_count", cell->active_worker_count}});
    obs::EmitCounter("cells_claimed_total", 1, "cells", kComponent);

    long claimed = 0;
    try {
        claimed = DrainCell(*cell);
    } catch (const std::exception& e) {
        // Leave the cell consistent before propagating; unfinished tasks stay
        // in_progress for the watchdog.
        obs::LogEvent(obs::LogLevel::Error, "cell_drain_failed", kComponent,
                      {{"error_code", obs::kErrInternal}, {"error", e.what()}});
        ReleaseCell(cell->cell_id);
        throw;
    }
    ReleaseCell(cell->cell_id);

    std::lock_guard<std::mutex> lk(stats_mutex_);
    stats_.cells_processed++;
    return claimed > 0;
}

auto WorkerLoop::DrainCell(const WorkCell& cell) -> long {
    auto model = store_->GetModel(cell.model_id);
    auto prompt = store_->GetPrompt(cell.prompt_id);
    if (!model || !prompt) {
        throw std::runtime_error("Cell " + std::to_string(cell.cell_id) + " references a missing model or prompt");
    }
    auto predictor = predictors_.Get(model->family);
    if (!predictor) {
        obs::LogEvent(obs::LogLevel::Error, "backend_missing", kComponent,
                      {{"error_code", obs::kErrPredictBackendMissing}, {"family", model->family}});
        throw std::runtime_error("No predictor for family '" + model->family + "'");
    }

    long claimed = 0;
    while (true) {
        auto batch = store_->ClaimTaskBatch(cell.cell_id, config_.batch_size);
        if (batch.empty()) {
            break;
        }
        claimed += static_cast<long>(batch.size());
        obs::ScopedTimer timer("batch_processed", kComponent, {{"batch_size", batch.size()}});
        obs::EmitCounter("tasks_claimed_total", static_cast<long>(batch.size()), "tasks", kComponent);
        ProcessBatch(cell, *model, *prompt, predictor, batch);
        {
            std::lock_guard<std::mutex> lk(stats_mutex_);
            stats_.batches++;
        }
    }
    return claimed;
}

void WorkerLoop::ProcessBatch(const WorkCell& cell,
                              const Model& model,
                              const Prompt& prompt,
                              const std::shared_ptr<IPredictor>& predictor,
                              const std::vector<ClaimedTask>& batch) {
    // The batch shares one claimed_at, so the whole batch shares one deadline.
    auto launched = std::chrono::steady_clock::now();
    auto deadline = launched + config_.predict_timeout;

    std::vector<std::future<PredictResult>> futures;
    futures.reserve(batch.size());
    for (const auto& task : batch) {
        futures.push_back(LaunchPredict(predictor, model, prompt, task.row));
    }

    for (size_t i = 0; i < batch.size(); ++i) {
        const auto& task = batch[i];
        if (futures[i].wait_until(deadline) != std::future_status::ready) {
            RecordFailure(task, obs::kErrPredictTimeout,
                          "predict timed out after " + std::to_string(config_.predict_timeout.count()) + "s");
            continue;
        }

        PredictResult result;
        try {
            result = futures[i].get();
        } catch (const PredictCapacityError& e) {
            RecordFailure(task, obs::kErrPredictCapacity, e.what());
            continue;
        } catch (const std::exception& e) {
            RecordFailure(task, obs::kErrPredictFailed, e.what());
            continue;
        }

        PredictionRecord record;
        record.cell_id = cell.cell_id;
        record.row_id = task.row.row_id;
        record.model_id = cell.model_id;
        record.prompt_id = cell.prompt_id;
        record.dataset_id = cell.dataset_id;
        record.label = result.label;
        record.latency_ms = result.latency_ms > 0.0 ? result.latency_ms : ElapsedMs(launched);
        record.worker_id = worker_id_;
        record.created_at = Clock::now();

        if (store_->CompleteTask(task, record)) {
            obs::EmitCounter("tasks_completed_total", 1, "tasks", kComponent);
            obs::EmitHistogram("predict_latency_ms", record.latency_ms, "ms", kComponent,
                               {{"family", model.family}});
            std::lock_guard<std::mutex> lk(stats_mutex_);
            stats_.tasks_completed++;
        } else {
            obs::LogEvent(obs::LogLevel::Warn, "completion_claim_lost", kComponent,
                          {{"task_id", task.task_id}, {"row_id", task.row.row_id}});
            obs::EmitCounter("claims_lost_total", 1, "tasks", kComponent);
            std::lock_guard<std::mutex> lk(stats_mutex_);
            stats_.claims_lost++;
        }
    }
}

void WorkerLoop::RecordFailure(const ClaimedTask& task, const std::string& error_code, const std::string& error) {
    auto outcome = store_->FailTaskAttempt(task, config_.max_retries, error);
    if (!outcome) {
        obs::LogEvent(obs::LogLevel::Warn, "failure_claim_lost", kComponent,
                      {{"task_id", task.task_id}, {"error_code", error_code}, {"error", error}});
        std::lock_guard<std::mutex> lk(stats_mutex_);
        stats_.claims_lost++;
        return;
    }

    bool exhausted = outcome->status == TaskStatus::FAILED;
    obs::LogEvent(exhausted ? obs::LogLevel::Error : obs::LogLevel::Warn,
                  exhausted ? "task_retries_exhausted" : "task_requeued", kComponent,
                  {{"task_id", task.task_id},
                   {"row_id", task.row.row_id},
                   {"retry_count", outcome->retry_count},
                   {"error_code", error_code},
                   {"error", error}});
    obs::EmitCounter(exhausted ? "tasks_failed_total" : "tasks_requeued_total", 1, "tasks", kComponent,
                     {{"reason", error_code}});

    std::lock_guard<std::mutex> lk(stats_mutex_);
    if (exhausted) {
        stats_.tasks_failed++;
    } else {
        stats_.tasks_requeued++;
    }
}

void WorkerLoop::ReleaseCell(long long cell_id) {
    try {
        auto status = store_->ReleaseCell(cell_id);
        obs::LogEvent(obs::LogLevel::Info, "cell_released", kComponent,
                      {{"status", CellStatusToString(status)}});
        obs::EmitCounter("cells_released_total", 1, "cells", kComponent,
                         {{"status", CellStatusToString(status)}});
    } catch (const std::exception& e) {
        obs::LogEvent(obs::LogLevel::Error, "cell_release_failed", kComponent,
                      {{"error_code", obs::kErrReleaseFailed}, {"cell_id", cell_id}, {"error", e.what()}});
        throw;
    }
}

} // namespace promptgrid
