#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "grid_control.grpc.pb.h"
#include "istore.h"
#include "task_expander.h"

namespace promptgrid {

using grpc::ServerContext;
using grpc::Status;

/**
 * @brief gRPC front of the task expander and the reporting reads.
 */
class GridControlServiceImpl final : public GridControl::Service {
public:
    explicit GridControlServiceImpl(std::shared_ptr<IStore> store);

    Status RegisterDataset(ServerContext* context, const RegisterDatasetRequest* request,
                           RegisterDatasetResponse* response) override;

    Status RegisterModel(ServerContext* context, const RegisterModelRequest* request,
                         RegisterModelResponse* response) override;

    Status RegisterPrompt(ServerContext* context, const RegisterPromptRequest* request,
                          RegisterPromptResponse* response) override;

    Status RegisterWorkCell(ServerContext* context, const RegisterWorkCellRequest* request,
                            WorkCellRegistration* response) override;

    Status RegisterMatrix(ServerContext* context, const RegisterMatrixRequest* request,
                          RegisterMatrixResponse* response) override;

    Status GetCell(ServerContext* context, const GetCellRequest* request,
                   CellStatusReply* response) override;

    Status ListFailedTasks(ServerContext* context, const ListFailedTasksRequest* request,
                           ListFailedTasksResponse* response) override;

private:
    std::shared_ptr<IStore> store_;
    TaskExpander expander_;
};

} // namespace promptgrid
