#include "watchdog.h"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "obs/error_codes.h"
#include "obs/logging.h"
#include "obs/metrics.h"

namespace promptgrid {

namespace {

constexpr auto kComponent = "watchdog";

} // namespace

Watchdog::Watchdog(std::shared_ptr<IStore> store, WatchdogConfig config)
    : store_(std::move(store)), config_(config) {
    if (!store_) {
        throw std::invalid_argument("Watchdog requires a store");
    }
}

Watchdog::~Watchdog() {
    Stop();
}

auto Watchdog::ReconcileStartup() -> WatchdogReport {
    spdlog::info("Running startup watchdog reconciliation...");
    return RunPass();
}

auto Watchdog::Start() -> void {
    if (running_) { return; }
    running_ = true;
    sweeper_thread_ = std::make_unique<std::thread>([this]() {
        spdlog::info("Watchdog periodic sweeper started (interval={}s, stale_threshold={}s).",
                     config_.interval.count(), config_.stale_threshold.count());
        while (running_) {
            std::unique_lock<std::mutex> lock(cv_m_);
            if (cv_.wait_for(lock, config_.interval, [this]() { return !running_.load(); })) {
                break;
            }
            lock.unlock();
            try {
                RunPass();
            } catch (const std::exception& e) {
                obs::LogEvent(obs::LogLevel::Error, "watchdog_pass_failed", kComponent,
                              {{"error_code", obs::kErrInternal}, {"error", e.what()}});
            }
        }
        spdlog::info("Watchdog periodic sweeper stopped.");
    });
}

auto Watchdog::Stop() -> void {
    running_ = false;
    cv_.notify_all();
    if (sweeper_thread_ && sweeper_thread_->joinable()) {
        sweeper_thread_->join();
    }
    sweeper_thread_.reset();
}

auto Watchdog::RunPass() -> WatchdogReport {
    obs::ScopedTimer timer("watchdog_pass", kComponent);
    WatchdogReport report;

    RecoverStaleTasks(report);
    // Reopen after resets so a cell released as done in the same window is
    // picked up by this pass.
    ReopenCells(report);

    passes_++;
    obs::EmitCounter("watchdog_passes_total", 1, "passes", kComponent);
    timer.Stop(report.errors > 0 ? obs::LogLevel::Warn : obs::LogLevel::Info,
               {{"tasks_requeued", report.tasks_requeued},
                {"tasks_failed", report.tasks_failed},
                {"cells_reopened", report.cells_reopened},
                {"errors", report.errors}});
    return report;
}

void Watchdog::RecoverStaleTasks(WatchdogReport& report) {
    std::vector<StaleTaskRef> stale;
    try {
        stale = store_->ListStaleTasks(config_.stale_threshold);
    } catch (const std::exception& e) {
        obs::LogEvent(obs::LogLevel::Error, "stale_scan_failed", kComponent,
                      {{"error_code", obs::kErrDbQueryFailed}, {"error", e.what()}});
        report.errors++;
        return;
    }

    for (const auto& ref : stale) {
        try {
            auto outcome = store_->ResetStaleTask(ref, config_.max_retries);
            if (!outcome) {
                // Finished or reclaimed between the scan and the reset.
                spdlog::debug("Stale task {} changed before reset, skipping", ref.task_id);
                continue;
            }
            bool exhausted = outcome->status == TaskStatus::FAILED;
            obs::LogEvent(exhausted ? obs::LogLevel::Error : obs::LogLevel::Warn,
                          exhausted ? "task_retries_exhausted" : "task_reset", kComponent,
                          {{"task_id", ref.task_id},
                           {"cell_id", ref.cell_id},
                           {"from", "in_progress"},
                           {"to", TaskStatusToString(outcome->status)},
                           {"retry_count", outcome->retry_count}});
            if (exhausted) {
                report.tasks_failed++;
                obs::EmitCounter("watchdog_tasks_failed_total", 1, "tasks", kComponent);
            } else {
                report.tasks_requeued++;
                obs::EmitCounter("watchdog_tasks_reset_total", 1, "tasks", kComponent);
            }
        } catch (const std::exception& e) {
            report.errors++;
            obs::LogEvent(obs::LogLevel::Error, "task_reset_failed", kComponent,
                          {{"error_code", obs::kErrWatchdogEntity}, {"task_id", ref.task_id},
                           {"error", e.what()}});
        }
    }
}

void Watchdog::ReopenCells(WatchdogReport& report) {
    std::vector<long long> cells;
    try {
        cells = store_->ListDoneCellsWithPendingTasks();
    } catch (const std::exception& e) {
        obs::LogEvent(obs::LogLevel::Error, "reopen_scan_failed", kComponent,
                      {{"error_code", obs::kErrDbQueryFailed}, {"error", e.what()}});
        report.errors++;
        return;
    }

    for (long long cell_id : cells) {
        try {
            auto status = store_->ReopenCell(cell_id);
            if (!status) {
                spdlog::debug("Cell {} no longer needs reopening", cell_id);
                continue;
            }
            report.cells_reopened++;
            obs::LogEvent(obs::LogLevel::Warn, "cell_reopened", kComponent,
                          {{"cell_id", cell_id}, {"from", "done"}, {"to", CellStatusToString(*status)}});
            obs::EmitCounter("watchdog_cells_reopened_total", 1, "cells", kComponent);
        } catch (const std::exception& e) {
            report.errors++;
            obs::LogEvent(obs::LogLevel::Error, "cell_reopen_failed", kComponent,
                          {{"error_code", obs::kErrWatchdogEntity}, {"cell_id", cell_id},
                           {"error", e.what()}});
        }
    }
}

} // namespace promptgrid
