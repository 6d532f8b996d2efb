#pragma once

#include <set>
#include <string>

namespace promptgrid {

/**
 * @brief Coordination state of a (model, prompt, dataset) work cell.
 */
enum class CellStatus {
    AVAILABLE,
    IN_USE,
    DONE
};

/**
 * @brief State of a single row-level prediction task.
 */
enum class TaskStatus {
    PENDING,
    IN_PROGRESS,
    DONE,
    FAILED
};

// Stored representation is lower case ("available", "in_progress", ...).
auto CellStatusToString(CellStatus status) -> std::string;
auto StringToCellStatus(const std::string& status_str) -> CellStatus;
auto TaskStatusToString(TaskStatus status) -> std::string;
auto StringToTaskStatus(const std::string& status_str) -> TaskStatus;

/**
 * @brief Valid row task transitions and the retry ceiling policy.
 */
class TaskStateMachine {
public:
    /**
     * @brief Checks if a transition from current to next is allowed.
     */
    static auto IsTransitionAllowed(TaskStatus current, TaskStatus next) -> bool;

    /**
     * @brief True for in_progress -> pending, the only backward task transition.
     * It is reserved for failed attempts and watchdog recovery.
     */
    static auto IsRecoveryTransition(TaskStatus current, TaskStatus next) -> bool;

    static auto GetValidNextStates(TaskStatus current) -> std::set<TaskStatus>;

    static auto IsTerminal(TaskStatus status) -> bool;

    /**
     * @brief Status after an attempt is abandoned (predict failure or stale claim).
     * @param retry_count_after retry count already incremented for this attempt.
     */
    static auto StatusAfterFailedAttempt(int retry_count_after, int max_retries) -> TaskStatus;
};

/**
 * @brief Valid work cell transitions and the release/reopen decisions.
 */
class CellStateMachine {
public:
    static auto IsTransitionAllowed(CellStatus current, CellStatus next) -> bool;

    /**
     * @brief True for done -> available/in_use, which only the watchdog reopen performs.
     */
    static auto IsReopenTransition(CellStatus current, CellStatus next) -> bool;

    /**
     * @brief Status a cell takes when a worker releases it.
     * @param active_after active worker count after this worker's decrement.
     * @param open_tasks number of pending or in_progress tasks in the cell.
     */
    static auto DecideRelease(int active_after, long open_tasks) -> CellStatus;

    /**
     * @brief Status a done cell takes when reopened.
     */
    static auto DecideReopen(int active_workers) -> CellStatus;
};

} // namespace promptgrid
