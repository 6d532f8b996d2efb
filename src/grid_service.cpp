#include "grid_service.h"

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "obs/context.h"
#include "obs/error_codes.h"
#include "obs/logging.h"

namespace promptgrid {

namespace {

constexpr auto kComponent = "grid_service";
constexpr int kDefaultFailedLimit = 100;

// Runs a handler body and maps exceptions onto gRPC status codes.
auto Guard(const std::string& rpc, const std::function<Status()>& body) -> Status {
    try {
        return body();
    } catch (const std::invalid_argument& e) {
        spdlog::warn("{} rejected: {}", rpc, e.what());
        return {grpc::StatusCode::INVALID_ARGUMENT, e.what()};
    } catch (const std::exception& e) {
        obs::LogEvent(obs::LogLevel::Error, "rpc_failed", kComponent,
                      {{"rpc", rpc}, {"error_code", obs::kErrInternal}, {"error", e.what()}});
        return {grpc::StatusCode::INTERNAL, e.what()};
    }
}

void FillRegistration(const CellRegistration& reg, WorkCellRegistration* out) {
    out->set_cell_id(reg.cell_id);
    out->set_created(reg.created);
    out->set_task_count(reg.task_count);
}

} // namespace

GridControlServiceImpl::GridControlServiceImpl(std::shared_ptr<IStore> store)
    : store_(store), expander_(std::move(store)) {}

auto GridControlServiceImpl::RegisterDataset([[maybe_unused]] ServerContext* context,
                                             const RegisterDatasetRequest* request,
                                             RegisterDatasetResponse* response) -> Status {
    return Guard("RegisterDataset", [&]() -> Status {
        spdlog::info("Received RegisterDataset request. Name: {}, Rows: {}", request->name(), request->rows_size());
        std::vector<RowInput> rows;
        rows.reserve(static_cast<size_t>(request->rows_size()));
        for (const auto& r : request->rows()) {
            rows.push_back({r.content(), r.expected_label()});
        }
        long long dataset_id = expander_.RegisterDataset(request->name(), rows);
        response->set_dataset_id(dataset_id);
        auto dataset = store_->GetDataset(dataset_id);
        response->set_row_count(dataset ? dataset->row_count : 0);
        return Status::OK;
    });
}

auto GridControlServiceImpl::RegisterModel([[maybe_unused]] ServerContext* context,
                                           const RegisterModelRequest* request,
                                           RegisterModelResponse* response) -> Status {
    return Guard("RegisterModel", [&]() -> Status {
        response->set_model_id(expander_.RegisterModel(request->name(), request->family()));
        return Status::OK;
    });
}

auto GridControlServiceImpl::RegisterPrompt([[maybe_unused]] ServerContext* context,
                                            const RegisterPromptRequest* request,
                                            RegisterPromptResponse* response) -> Status {
    return Guard("RegisterPrompt", [&]() -> Status {
        response->set_prompt_id(expander_.RegisterPrompt(request->text()));
        return Status::OK;
    });
}

auto GridControlServiceImpl::RegisterWorkCell([[maybe_unused]] ServerContext* context,
                                              const RegisterWorkCellRequest* request,
                                              WorkCellRegistration* response) -> Status {
    return Guard("RegisterWorkCell", [&]() -> Status {
        auto reg = expander_.RegisterWorkCell(request->model_id(), request->prompt_id(), request->dataset_id());
        FillRegistration(reg, response);
        return Status::OK;
    });
}

auto GridControlServiceImpl::RegisterMatrix([[maybe_unused]] ServerContext* context,
                                            const RegisterMatrixRequest* request,
                                            RegisterMatrixResponse* response) -> Status {
    return Guard("RegisterMatrix", [&]() -> Status {
        std::vector<long long> model_ids(request->model_ids().begin(), request->model_ids().end());
        std::vector<long long> prompt_ids(request->prompt_ids().begin(), request->prompt_ids().end());
        auto matrix = expander_.RegisterMatrix(model_ids, prompt_ids, request->dataset_id());
        for (const auto& reg : matrix.cells) {
            FillRegistration(reg, response->add_cells());
        }
        response->set_created(matrix.created);
        response->set_existing(matrix.existing);
        return Status::OK;
    });
}

auto GridControlServiceImpl::GetCell([[maybe_unused]] ServerContext* context,
                                     const GetCellRequest* request,
                                     CellStatusReply* response) -> Status {
    return Guard("GetCell", [&]() -> Status {
        auto progress = store_->GetCellProgress(request->cell_id());
        if (!progress) {
            return {grpc::StatusCode::NOT_FOUND, "cell " + std::to_string(request->cell_id()) + " not found"};
        }
        const auto& cell = progress->cell;
        response->set_cell_id(cell.cell_id);
        response->set_model_id(cell.model_id);
        response->set_prompt_id(cell.prompt_id);
        response->set_dataset_id(cell.dataset_id);
        response->set_status(CellStatusToString(cell.status));
        response->set_active_worker_count(cell.active_worker_count);
        response->set_pending(progress->pending);
        response->set_in_progress(progress->in_progress);
        response->set_done(progress->done);
        response->set_failed(progress->failed);
        return Status::OK;
    });
}

auto GridControlServiceImpl::ListFailedTasks([[maybe_unused]] ServerContext* context,
                                             const ListFailedTasksRequest* request,
                                             ListFailedTasksResponse* response) -> Status {
    return Guard("ListFailedTasks", [&]() -> Status {
        if (request->limit() < 0) {
            throw std::invalid_argument("limit must not be negative");
        }
        std::optional<long long> cell_id;
        if (request->cell_id() != 0) {
            cell_id = request->cell_id();
        }
        int limit = request->limit() == 0 ? kDefaultFailedLimit : request->limit();
        for (const auto& task : store_->ListFailedTasks(cell_id, limit)) {
            auto* out = response->add_tasks();
            out->set_task_id(task.task_id);
            out->set_cell_id(task.cell_id);
            out->set_row_id(task.row_id);
            out->set_retry_count(task.retry_count);
            out->set_last_error(task.last_error);
        }
        return Status::OK;
    });
}

} // namespace promptgrid
