//===----------------------------------------------------------------------===//
//                         DuckES Query Runner
//
// errors/harness_error.cpp
//===----------------------------------------------------------------------===//

#include "errors/harness_error.hpp"

namespace duckes {

LoadError::LoadError(std::string table_p,
                     std::optional<uint64_t> batch_index_p,
                     std::optional<uint64_t> row_position_p,
                     std::string cause_p,
                     bool structural_p)
    : HarnessError(FormatMessage(table_p, batch_index_p, row_position_p, cause_p))
    , table(std::move(table_p))
    , batch_index(batch_index_p)
    , row_position(row_position_p)
    , cause(std::move(cause_p))
    , structural(structural_p) {
}

std::string LoadError::FormatMessage(const std::string& table,
                                     const std::optional<uint64_t>& batch_index,
                                     const std::optional<uint64_t>& row_position,
                                     const std::string& cause) {
    std::string message = "Failed to load table '" + table + "'";
    if (batch_index) {
        message += " at batch " + std::to_string(*batch_index);
    }
    if (row_position) {
        message += " (row " + std::to_string(*row_position) + ")";
    }
    message += ": " + cause;
    return message;
}

} // namespace duckes
