#pragma once

#include <memory>
#include <string>
#include <vector>

#include "istore.h"

namespace promptgrid {

struct MatrixRegistration {
    std::vector<CellRegistration> cells;
    int created = 0;
    int existing = 0;
};

/**
 * @brief Validates registration requests and materializes work cells.
 *
 * Rejections throw std::invalid_argument. Duplicate registrations are no-ops.
 */
class TaskExpander {
public:
    explicit TaskExpander(std::shared_ptr<IStore> store);

    auto RegisterDataset(const std::string& name, const std::vector<RowInput>& rows) -> long long;
    auto RegisterModel(const std::string& name, const std::string& family) -> long long;
    auto RegisterPrompt(const std::string& text) -> long long;

    auto RegisterWorkCell(long long model_id, long long prompt_id, long long dataset_id) -> CellRegistration;

    // Registers every (model, prompt) combination against one dataset.
    auto RegisterMatrix(const std::vector<long long>& model_ids,
                        const std::vector<long long>& prompt_ids,
                        long long dataset_id) -> MatrixRegistration;

private:
    std::shared_ptr<IStore> store_;
};

} // namespace promptgrid
