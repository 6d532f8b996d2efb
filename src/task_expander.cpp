#include "task_expander.h"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "obs/error_codes.h"
#include "obs/logging.h"
#include "obs/metrics.h"

namespace promptgrid {

namespace {

auto Reject(const std::string& message) -> std::invalid_argument {
    obs::LogEvent(obs::LogLevel::Warn, "registration_rejected", "task_expander",
                  {{"error_code", obs::kErrExpandInvalid}, {"reason", message}});
    return std::invalid_argument(message);
}

} // namespace

TaskExpander::TaskExpander(std::shared_ptr<IStore> store) : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("TaskExpander requires a store");
    }
}

auto TaskExpander::RegisterDataset(const std::string& name, const std::vector<RowInput>& rows) -> long long {
    if (name.empty()) {
        throw Reject("Rows must belong to a named dataset");
    }
    if (rows.empty()) {
        throw Reject("Dataset '" + name + "' has no rows");
    }
    return store_->RegisterDataset(name, rows);
}

auto TaskExpander::RegisterModel(const std::string& name, const std::string& family) -> long long {
    if (name.empty() || family.empty()) {
        throw Reject("Model name and family are required");
    }
    return store_->RegisterModel(name, family);
}

auto TaskExpander::RegisterPrompt(const std::string& text) -> long long {
    if (text.empty()) {
        throw Reject("Prompt text is required");
    }
    return store_->RegisterPrompt(text);
}

auto TaskExpander::RegisterWorkCell(long long model_id, long long prompt_id, long long dataset_id)
    -> CellRegistration {
    if (model_id <= 0 || prompt_id <= 0 || dataset_id <= 0) {
        throw Reject("Work cell ids must be positive");
    }

    CellRegistration reg;
    try {
        reg = store_->RegisterWorkCell(model_id, prompt_id, dataset_id);
    } catch (const std::invalid_argument& e) {
        throw Reject(e.what());
    }

    if (reg.created) {
        obs::LogEvent(obs::LogLevel::Info, "cell_registered", "task_expander",
                      {{"cell_id", reg.cell_id}, {"model_id", model_id}, {"prompt_id", prompt_id},
                       {"dataset_id", dataset_id}, {"task_count", reg.task_count}});
        obs::EmitCounter("cells_registered_total", 1, "cells", "task_expander");
        obs::EmitCounter("tasks_registered_total", reg.task_count, "tasks", "task_expander");
    } else {
        spdlog::debug("Work cell {} already registered for model={} prompt={} dataset={}",
                      reg.cell_id, model_id, prompt_id, dataset_id);
    }
    return reg;
}

auto TaskExpander::RegisterMatrix(const std::vector<long long>& model_ids,
                                  const std::vector<long long>& prompt_ids,
                                  long long dataset_id) -> MatrixRegistration {
    if (model_ids.empty() || prompt_ids.empty()) {
        throw Reject("Matrix registration needs at least one model and one prompt");
    }

    MatrixRegistration out;
    for (long long model_id : model_ids) {
        for (long long prompt_id : prompt_ids) {
            auto reg = RegisterWorkCell(model_id, prompt_id, dataset_id);
            if (reg.created) {
                out.created++;
            } else {
                out.existing++;
            }
            out.cells.push_back(reg);
        }
    }
    spdlog::info("Registered matrix for dataset {}: {} cells created, {} already present",
                 dataset_id, out.created, out.existing);
    return out;
}

} // namespace promptgrid
