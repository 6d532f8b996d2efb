#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "cell_state_machine.h"

namespace promptgrid {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct RowInput {
    std::string content;
    std::string expected_label;
};

struct Row {
    long long row_id = 0;
    long long dataset_id = 0;
    std::string content;
    std::string expected_label;
};

struct Dataset {
    long long dataset_id = 0;
    std::string name;
    long row_count = 0;
};

struct Model {
    long long model_id = 0;
    std::string name;
    std::string family; // worker pool that may serve it, e.g. "ollama"
};

struct Prompt {
    long long prompt_id = 0;
    std::string text;
};

/**
 * @brief One (model, prompt, dataset) coordination unit.
 */
struct WorkCell {
    long long cell_id = 0;
    long long model_id = 0;
    long long prompt_id = 0;
    long long dataset_id = 0;
    CellStatus status = CellStatus::AVAILABLE;
    int active_worker_count = 0;
};

struct RowTask {
    long long task_id = 0;
    long long cell_id = 0;
    long long row_id = 0;
    TaskStatus status = TaskStatus::PENDING;
    int retry_count = 0;
    std::optional<TimePoint> claimed_at;
    std::string last_error;
};

/**
 * @brief A RowTask handed to a worker by a batch claim, joined with its row.
 *
 * claimed_at is the claim token: every later write for this task is guarded by it.
 */
struct ClaimedTask {
    long long task_id = 0;
    long long cell_id = 0;
    int retry_count = 0;
    TimePoint claimed_at;
    Row row;
};

struct PredictionRecord {
    long long prediction_id = 0;
    long long cell_id = 0;
    long long row_id = 0;
    long long model_id = 0;
    long long prompt_id = 0;
    long long dataset_id = 0;
    std::string label;
    double latency_ms = 0.0;
    std::string worker_id;
    TimePoint created_at;
};

struct CellRegistration {
    long long cell_id = 0;
    bool created = false;
    long task_count = 0;
};

struct CellProgress {
    WorkCell cell;
    long pending = 0;
    long in_progress = 0;
    long done = 0;
    long failed = 0;

    auto Total() const -> long { return pending + in_progress + done + failed; }
    auto Open() const -> long { return pending + in_progress; }
};

/**
 * @brief Reference to an in_progress task the watchdog considers abandoned.
 */
struct StaleTaskRef {
    long long task_id = 0;
    long long cell_id = 0;
    TimePoint claimed_at;
};

struct TaskResetOutcome {
    TaskStatus status = TaskStatus::PENDING;
    int retry_count = 0;
};

} // namespace promptgrid
