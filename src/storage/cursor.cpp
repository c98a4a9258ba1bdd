#include "storage/cursor.hpp"

namespace strata::storage {

    auto Cursor::table_start(Table &table) -> Cursor {
        return Cursor(table, 0, table.num_rows() == 0);
    }

    auto Cursor::table_end(Table &table) -> Cursor {
        return Cursor(table, table.num_rows(), true);
    }

    auto Cursor::value() -> std::pair<core::Status, core::ByteSpan> {
        return table_.row_slot(row_num_);
    }

    void Cursor::advance() {
        row_num_ += 1;
        if (row_num_ >= table_.num_rows()) {
            end_of_table_ = true;
        }
    }

} // namespace strata::storage
