#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "worker_loop.h"

namespace promptgrid {

enum class WorkerState {
    RUNNING,
    EXITED,
    FAILED
};

struct WorkerInfo {
    std::string worker_id;
    WorkerState state = WorkerState::RUNNING;
    std::string error;
};

/**
 * @brief Bounded set of threads, each running an independent WorkerLoop.
 */
class WorkerPool {
public:
    using LoopFactory = std::function<std::unique_ptr<WorkerLoop>()>;

    explicit WorkerPool(LoopFactory factory);
    ~WorkerPool();

    // Spawns `threads` workers. Throws if the pool is already running or stopping.
    auto Start(int threads) -> void;

    // Blocks until every worker has exited on its own.
    auto Wait() -> void;

    // Signals all workers to stop after their current cell and joins them.
    auto Stop() -> void;

    auto ListWorkers() -> std::vector<WorkerInfo>;
    auto RunningCount() -> size_t;

private:
    auto JoinAll() -> void;

    LoopFactory factory_;
    std::mutex mutex_;
    std::map<std::string, WorkerInfo> workers_;
    std::vector<std::thread> threads_;
    std::shared_ptr<std::atomic<bool>> stop_flag_ = std::make_shared<std::atomic<bool>>(false);
    std::atomic<bool> stopping_{false};
    size_t running_ = 0;
};

} // namespace promptgrid
