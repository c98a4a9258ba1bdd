#pragma once

#include "core/status.hpp"
#include "storage/row.hpp"
#include "storage/table.hpp"

#include <functional>
#include <utility>
#include <vector>

namespace strata::engine {

    // Appends the row after the last one. TableFull once TABLE_MAX_ROWS rows exist;
    // the row count is then left unchanged.
    [[nodiscard]] auto execute_insert(storage::Table &table, const storage::Row &row)
        -> core::Status;

    // Visits every row in row order, stopping at the first addressing failure.
    auto scan_rows(storage::Table &table, const std::function<void(const storage::Row &)> &callback)
        -> core::Status;

    [[nodiscard]] auto execute_select(storage::Table &table)
        -> std::pair<core::Status, std::vector<storage::Row>>;

} // namespace strata::engine
