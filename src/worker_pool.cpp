#include "worker_pool.h"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "metrics.h"

namespace promptgrid {

WorkerPool::WorkerPool(LoopFactory factory) : factory_(std::move(factory)) {
    if (!factory_) {
        throw std::invalid_argument("WorkerPool requires a loop factory");
    }
}

WorkerPool::~WorkerPool() {
    Stop();
}

auto WorkerPool::Start(int threads) -> void {
    if (threads <= 0) {
        throw std::invalid_argument("WorkerPool needs at least one thread");
    }

    std::lock_guard<std::mutex> lk(mutex_);
    if (stopping_) {
        throw std::runtime_error("WorkerPool is stopping");
    }
    if (!threads_.empty()) {
        throw std::runtime_error("WorkerPool already started");
    }

    for (int i = 0; i < threads; ++i) {
        // Construct on the caller's thread so configuration errors surface from Start.
        std::shared_ptr<WorkerLoop> loop = factory_();
        const std::string worker_id = loop->WorkerId();

        WorkerInfo info;
        info.worker_id = worker_id;
        workers_[worker_id] = info;
        running_++;

        auto stop_flag = stop_flag_;
        threads_.emplace_back([this, loop, worker_id, stop_flag]() {
            WorkerState final_state = WorkerState::EXITED;
            std::string error;
            try {
                loop->Run(stop_flag.get());
            } catch (const std::exception& e) {
                spdlog::error("Worker {} failed: {}", worker_id, e.what());
                final_state = WorkerState::FAILED;
                error = e.what();
                metrics::MetricsRegistry::Instance().Increment("worker_failed_total", {{"error", "exception"}});
            }

            std::lock_guard<std::mutex> inner_lk(mutex_);
            workers_[worker_id].state = final_state;
            workers_[worker_id].error = error;
            running_--;
            metrics::MetricsRegistry::Instance().SetGauge("worker_active_count", static_cast<double>(running_));
        });
    }
    metrics::MetricsRegistry::Instance().SetGauge("worker_active_count", static_cast<double>(running_));
    spdlog::info("WorkerPool started {} workers", threads);
}

auto WorkerPool::JoinAll() -> void {
    std::vector<std::thread> to_join;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto& t : threads_) {
            if (t.joinable()) {
                to_join.push_back(std::move(t));
            }
        }
        threads_.clear();
    }
    for (auto& t : to_join) {
        t.join();
    }
}

auto WorkerPool::Wait() -> void {
    JoinAll();
}

auto WorkerPool::Stop() -> void {
    if (stopping_.exchange(true)) { return; }

    spdlog::info("Stopping WorkerPool, waiting for {} workers...", RunningCount());
    stop_flag_->store(true);
    JoinAll();
}

auto WorkerPool::ListWorkers() -> std::vector<WorkerInfo> {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<WorkerInfo> out;
    for (const auto& kv : workers_) {
        out.push_back(kv.second);
    }
    return out;
}

auto WorkerPool::RunningCount() -> size_t {
    std::lock_guard<std::mutex> lk(mutex_);
    return running_;
}

} // namespace promptgrid
