#pragma once

#include "core/common.hpp"
#include "core/status.hpp"
#include "storage/pager.hpp"

#include <memory>
#include <string>
#include <utility>

namespace strata::storage {

    // Owns the pager and the logical row count. Rows are addressed purely by
    // position: row i lives in page i / ROWS_PER_PAGE at byte
    // (i % ROWS_PER_PAGE) * ROW_SIZE.
    class Table {
        struct OpenTag {
            explicit OpenTag() = default;
        };

      public:
        static auto open(const std::string &path) -> std::pair<core::Status, std::unique_ptr<Table>>;

        // Runs close() when the owner did not; a failed flush here terminates the process.
        Table(OpenTag, std::unique_ptr<Pager> pager, size_t num_rows);
        ~Table();

        Table(const Table &) = delete;
        Table &operator=(const Table &) = delete;
        Table(Table &&) = delete;
        Table &operator=(Table &&) = delete;

        // No check against num_rows(); rows past the page ceiling fail in the pager.
        auto row_slot(core::RowId row_num) -> std::pair<core::Status, core::ByteSpan>;

        [[nodiscard]] auto num_rows() const -> size_t {
            return num_rows_;
        }
        void increment_num_rows() {
            ++num_rows_;
        }

        /*
         * Teardown. Flushes every cached fully populated page in full, then the
         * partial last page up to its last row, then drops all remaining pages
         * without writing them. Runs at most once; the first failed flush is
         * returned and leaves the table closed.
         */
        auto close() -> core::Status;

        [[nodiscard]] auto is_closed() const -> bool {
            return pager_ == nullptr;
        }

        // Read-only view for inspection; page buffers are reached through row_slot().
        [[nodiscard]] auto pager() const -> const Pager & {
            return *pager_;
        }

      private:
        auto flush_pages() -> core::Status;

        std::unique_ptr<Pager> pager_;
        size_t num_rows_;
    };

} // namespace strata::storage
