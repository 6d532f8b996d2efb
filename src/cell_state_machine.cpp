#include "cell_state_machine.h"
#include <stdexcept>

namespace promptgrid {

auto CellStatusToString(CellStatus status) -> std::string {
    switch (status) {
        case CellStatus::AVAILABLE: return "available";
        case CellStatus::IN_USE: return "in_use";
        case CellStatus::DONE: return "done";
        default: return "unknown";
    }
}

auto StringToCellStatus(const std::string& status_str) -> CellStatus {
    if (status_str == "available") { return CellStatus::AVAILABLE; }
    if (status_str == "in_use") { return CellStatus::IN_USE; }
    if (status_str == "done") { return CellStatus::DONE; }
    throw std::runtime_error("Invalid cell status string: " + status_str);
}

auto TaskStatusToString(TaskStatus status) -> std::string {
    switch (status) {
        case TaskStatus::PENDING: return "pending";
        case TaskStatus::IN_PROGRESS: return "in_progress";
        case TaskStatus::DONE: return "done";
        case TaskStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

auto StringToTaskStatus(const std::string& status_str) -> TaskStatus {
    if (status_str == "pending") { return TaskStatus::PENDING; }
    if (status_str == "in_progress") { return TaskStatus::IN_PROGRESS; }
    if (status_str == "done") { return TaskStatus::DONE; }
    if (status_str == "failed") { return TaskStatus::FAILED; }
    throw std::runtime_error("Invalid task status string: " + status_str);
}

auto TaskStateMachine::IsTransitionAllowed(TaskStatus current, TaskStatus next) -> bool {
    if (current == next) { return true; }

    switch (current) {
        case TaskStatus::PENDING:
            return next == TaskStatus::IN_PROGRESS;
        case TaskStatus::IN_PROGRESS:
            return next == TaskStatus::DONE || next == TaskStatus::PENDING || next == TaskStatus::FAILED;
        case TaskStatus::DONE:
        case TaskStatus::FAILED:
        default:
            return false;
    }
}

auto TaskStateMachine::IsRecoveryTransition(TaskStatus current, TaskStatus next) -> bool {
    return current == TaskStatus::IN_PROGRESS && next == TaskStatus::PENDING;
}

auto TaskStateMachine::GetValidNextStates(TaskStatus current) -> std::set<TaskStatus> {
    std::set<TaskStatus> next;
    for (int i = 0; i <= (int)TaskStatus::FAILED; ++i) {
        auto s = static_cast<TaskStatus>(i);
        if (IsTransitionAllowed(current, s)) {
            next.insert(s);
        }
    }
    return next;
}

auto TaskStateMachine::IsTerminal(TaskStatus status) -> bool {
    return status == TaskStatus::DONE || status == TaskStatus::FAILED;
}

auto TaskStateMachine::StatusAfterFailedAttempt(int retry_count_after, int max_retries) -> TaskStatus {
    return retry_count_after > max_retries ? TaskStatus::FAILED : TaskStatus::PENDING;
}

auto CellStateMachine::IsTransitionAllowed(CellStatus current, CellStatus next) -> bool {
    if (current == next) { return true; }

    switch (current) {
        case CellStatus::AVAILABLE:
            return next == CellStatus::IN_USE;
        case CellStatus::IN_USE:
            return next == CellStatus::AVAILABLE || next == CellStatus::DONE;
        case CellStatus::DONE:
            return next == CellStatus::AVAILABLE || next == CellStatus::IN_USE;
        default:
            return false;
    }
}

auto CellStateMachine::IsReopenTransition(CellStatus current, CellStatus next) -> bool {
    return current == CellStatus::DONE && next != CellStatus::DONE;
}

auto CellStateMachine::DecideRelease(int active_after, long open_tasks) -> CellStatus {
    if (active_after > 0) { return CellStatus::IN_USE; }
    return open_tasks == 0 ? CellStatus::DONE : CellStatus::AVAILABLE;
}

auto CellStateMachine::DecideReopen(int active_workers) -> CellStatus {
    return active_workers > 0 ? CellStatus::IN_USE : CellStatus::AVAILABLE;
}

} // namespace promptgrid
