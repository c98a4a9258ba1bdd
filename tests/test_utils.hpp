#pragma once
#include "core/common.hpp"
#include "engine/executor.hpp"
#include "storage/row.hpp"
#include "storage/table.hpp"
#include <filesystem>
#include <fmt/core.h>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

namespace strata::test {

    inline auto generate_username(size_t index) -> std::string {
        return fmt::format("user{:04d}", index);
    }

    inline auto generate_email(size_t index) -> std::string {
        return fmt::format("user{:04d}@example.com", index);
    }

    inline auto generate_row(size_t index) -> storage::Row {
        return storage::Row(static_cast<uint32_t>(index), generate_username(index),
                            generate_email(index));
    }

    // Byte offset of a row in the backing file
    inline auto file_offset_of(size_t row_num) -> size_t {
        return (row_num / core::ROWS_PER_PAGE) * core::PAGE_SIZE +
               (row_num % core::ROWS_PER_PAGE) * core::ROW_SIZE;
    }

    // Unique database file under the system temp directory, removed after each test.
    class TableTestFixture : public ::testing::Test {
      protected:
        void SetUp() override {
            const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
            test_db_path_ = (std::filesystem::temp_directory_path() /
                             fmt::format("strata_{}_{}_{}.db", info->test_suite_name(),
                                         info->name(), ::getpid()))
                                .string();
            cleanup_test_files();
        }

        void TearDown() override {
            table_.reset();
            cleanup_test_files();
        }

        void cleanup_test_files() {
            std::filesystem::remove(test_db_path_);
        }

        auto open_table() -> void {
            auto [status, table] = storage::Table::open(test_db_path_);
            ASSERT_TRUE(status.ok()) << status.to_string();
            table_ = std::move(table);
        }

        auto reopen_table() -> void {
            if (table_) {
                ASSERT_TRUE(table_->close().ok());
                table_.reset();
            }
            open_table();
        }

        auto insert_rows(size_t count, size_t first_id = 0) -> void {
            for (size_t i = 0; i < count; ++i) {
                ASSERT_TRUE(engine::execute_insert(*table_, generate_row(first_id + i)).ok())
                    << "insert " << i;
            }
        }

        auto file_size() const -> size_t {
            return std::filesystem::file_size(test_db_path_);
        }

        std::unique_ptr<storage::Table> table_;
        std::string test_db_path_;
    };

} // namespace strata::test
