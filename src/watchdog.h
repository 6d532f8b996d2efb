#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "grid_config.h"
#include "istore.h"

namespace promptgrid {

struct WatchdogReport {
    long tasks_requeued = 0;
    long tasks_failed = 0;
    long cells_reopened = 0;
    long errors = 0;
};

/**
 * @brief Recovers work abandoned by crashed or hung workers.
 */
class Watchdog {
public:
    Watchdog(std::shared_ptr<IStore> store, WatchdogConfig config);
    ~Watchdog();

    /**
     * @brief One full pass before the periodic loop starts.
     * Called on startup to recover from previous crashes.
     */
    auto ReconcileStartup() -> WatchdogReport;

    /**
     * @brief Resets stale in_progress tasks, then reopens done cells that
     * regained pending tasks. Errors on one task or cell never abort the pass.
     */
    auto RunPass() -> WatchdogReport;

    /**
     * @brief Starts a background thread running RunPass every config.interval.
     */
    void Start();

    /**
     * @brief Stops the background thread.
     */
    void Stop();

    auto PassCount() const -> long { return passes_.load(); }

private:
    void RecoverStaleTasks(WatchdogReport& report);
    void ReopenCells(WatchdogReport& report);

    std::shared_ptr<IStore> store_;
    WatchdogConfig config_;

    std::atomic<long> passes_{0};
    std::atomic<bool> running_{false};
    std::mutex cv_m_;
    std::condition_variable cv_;
    std::unique_ptr<std::thread> sweeper_thread_;
};

} // namespace promptgrid
