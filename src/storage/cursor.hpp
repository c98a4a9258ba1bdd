#pragma once

#include "core/common.hpp"
#include "core/status.hpp"
#include "storage/table.hpp"

#include <utility>

namespace strata::storage {

    // Forward-only position over a table's rows. Borrows the table; must not
    // outlive it.
    class Cursor {
      public:
        static auto table_start(Table &table) -> Cursor;
        // One past the last row: where the next insert goes, not a readable row.
        static auto table_end(Table &table) -> Cursor;

        auto value() -> std::pair<core::Status, core::ByteSpan>;
        void advance();

        [[nodiscard]] auto row_num() const -> core::RowId {
            return row_num_;
        }
        [[nodiscard]] auto end_of_table() const -> bool {
            return end_of_table_;
        }

      private:
        Cursor(Table &table, core::RowId row_num, bool end_of_table)
            : table_(table), row_num_(row_num), end_of_table_(end_of_table) {}

        Table &table_;
        core::RowId row_num_;
        bool end_of_table_;
    };

} // namespace strata::storage
