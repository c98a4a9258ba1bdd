#include "engine/executor.hpp"
#include "log/logger.hpp"
#include "storage/cursor.hpp"

#include <fmt/core.h>

namespace strata::engine {

    auto execute_insert(storage::Table &table, const storage::Row &row) -> core::Status {
        if (table.num_rows() >= core::TABLE_MAX_ROWS) {
            LOG_WARN("Rejected insert of id {}: table holds {} rows", row.id, table.num_rows());
            return core::Status::TableFull(
                fmt::format("Table full. {} >= {} rows", table.num_rows(), core::TABLE_MAX_ROWS));
        }

        auto cursor = storage::Cursor::table_end(table);
        auto [status, slot] = cursor.value();
        if (!status.ok()) {
            LOG_ERROR("Insert of id {} failed at row {}: {}", row.id, cursor.row_num(),
                      status.to_string());
            return status;
        }

        row.serialize(slot);
        table.increment_num_rows();
        LOG_TRACE("Inserted id {} at row {}", row.id, cursor.row_num());
        return core::Status::Ok();
    }

    auto scan_rows(storage::Table &table, const std::function<void(const storage::Row &)> &callback)
        -> core::Status {
        auto cursor = storage::Cursor::table_start(table);

        while (!cursor.end_of_table()) {
            auto [status, slot] = cursor.value();
            if (!status.ok()) {
                LOG_ERROR("Select stopped at row {}: {}", cursor.row_num(), status.to_string());
                return status;
            }
            callback(storage::Row::deserialize(slot));
            cursor.advance();
        }
        return core::Status::Ok();
    }

    auto execute_select(storage::Table &table) -> std::pair<core::Status, std::vector<storage::Row>> {
        std::vector<storage::Row> rows;
        rows.reserve(table.num_rows() < core::TABLE_MAX_ROWS ? table.num_rows()
                                                             : core::TABLE_MAX_ROWS);

        auto status = scan_rows(table, [&](const storage::Row &row) { rows.push_back(row); });
        return {status, std::move(rows)};
    }

} // namespace strata::engine
