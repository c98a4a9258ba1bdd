#include "storage/table.hpp"
#include "log/logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <fmt/core.h>

namespace strata::storage {

    auto Table::open(const std::string &path) -> std::pair<core::Status, std::unique_ptr<Table>> {
        auto [status, pager] = Pager::open(path);
        if (!status.ok()) {
            return {status, nullptr};
        }

        // a trailing partial row is not counted
        const size_t num_rows = pager->file_length() / core::ROW_SIZE;
        if (pager->file_length() % core::ROW_SIZE != 0) {
            LOG_DEBUG("Ignoring {} trailing byte(s) past the last whole row in '{}'",
                      pager->file_length() % core::ROW_SIZE, path);
        }

        auto table = std::make_unique<Table>(OpenTag{}, std::move(pager), num_rows);
        LOG_INFO("Table opened: path='{}', rows={}", path, num_rows);
        return {core::Status::Ok(), std::move(table)};
    }

    Table::Table(OpenTag, std::unique_ptr<Pager> pager, size_t num_rows)
        : pager_(std::move(pager)), num_rows_(num_rows) {}

    Table::~Table() {
        if (is_closed())
            return;

        auto status = close();
        if (!status.ok()) {
            LOG_FATAL("Aborting: table teardown failed: {}", status.to_string());
            log::Logger::instance().shutdown();
            std::abort();
        }
    }

    auto Table::row_slot(core::RowId row_num) -> std::pair<core::Status, core::ByteSpan> {
        if (is_closed()) {
            return {core::Status::IOError("Table is closed"), {}};
        }

        // saturate so the pager's bound check rejects rows past the ceiling
        const auto page_num = static_cast<core::PageId>(
            std::min<size_t>(row_num / core::ROWS_PER_PAGE, core::TABLE_MAX_PAGES));

        auto [status, page] = pager_->get_page(page_num);
        if (!status.ok()) {
            return {status, {}};
        }

        const size_t byte_offset = (row_num % core::ROWS_PER_PAGE) * core::ROW_SIZE;
        return {core::Status::Ok(), page.subspan(byte_offset, core::ROW_SIZE)};
    }

    auto Table::flush_pages() -> core::Status {
        const size_t num_full_pages = num_rows_ / core::ROWS_PER_PAGE;
        size_t pages_written = 0;

        for (size_t i = 0; i < num_full_pages && i < core::TABLE_MAX_PAGES; i++) {
            const auto page_num = static_cast<core::PageId>(i);
            if (!pager_->is_cached(page_num))
                continue;

            auto status = pager_->flush(page_num, core::PAGE_SIZE);
            if (!status.ok())
                return status;
            pager_->release(page_num);
            pages_written++;
        }

        // Partial last page: only the bytes of real rows reach the file
        const size_t num_additional_rows = num_rows_ % core::ROWS_PER_PAGE;
        if (num_additional_rows > 0 && num_full_pages < core::TABLE_MAX_PAGES) {
            const auto page_num = static_cast<core::PageId>(num_full_pages);
            if (pager_->is_cached(page_num)) {
                auto status = pager_->flush(page_num, num_additional_rows * core::ROW_SIZE);
                if (!status.ok())
                    return status;
                pager_->release(page_num);
                pages_written++;
            }
        }

        LOG_DEBUG("Teardown flushed {} page(s), discarding {} untouched page(s)", pages_written,
                  pager_->cached_pages());
        return core::Status::Ok();
    }

    auto Table::close() -> core::Status {
        if (is_closed())
            return core::Status::Ok();

        auto status = flush_pages();
        if (!status.ok()) {
            LOG_FATAL("Failed to flush table '{}': {}", pager_->path(), status.to_string());
        } else {
            LOG_INFO("Table closed: path='{}', rows={}", pager_->path(), num_rows_);
        }

        pager_->release_all();
        pager_.reset();
        return status;
    }

} // namespace strata::storage
