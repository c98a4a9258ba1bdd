#include "engine/executor.hpp"
#include "storage/table.hpp"
#include "test_utils.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace strata::test {

    class FailureInjectionTest : public TableTestFixture {
      protected:
        void truncate_file(size_t new_size) {
            if (truncate(test_db_path_.c_str(), static_cast<off_t>(new_size)) != 0) {
                FAIL() << "Failed to truncate file";
            }
        }

        void corrupt_file_at_offset(size_t offset, uint8_t xor_val = 0xFF) {
            std::fstream file(test_db_path_, std::ios::in | std::ios::out | std::ios::binary);
            ASSERT_TRUE(file.good());
            file.seekg(static_cast<std::streamoff>(offset));
            char byte;
            file.read(&byte, 1);
            file.seekp(static_cast<std::streamoff>(offset));
            byte ^= static_cast<char>(xor_val);
            file.write(&byte, 1);
        }
    };

    // Leaves one dirty row on /dev/full and lets the destructor tear the table down.
    static void drop_unflushable_table() {
        auto [status, table] = storage::Table::open("/dev/full");
        if (status.ok() && engine::execute_insert(*table, generate_row(1)).ok()) {
            table.reset();
        }
    }

    // ============================================================================
    // DAMAGED FILES
    // ============================================================================

    TEST_F(FailureInjectionTest, TruncatedMidRowDropsPartialRow) {
        open_table();
        insert_rows(6);
        ASSERT_TRUE(table_->close().ok());
        table_.reset();

        truncate_file(file_offset_of(5) + 100);
        open_table();
        EXPECT_EQ(table_->num_rows(), 5u);

        auto [status, rows] = engine::execute_select(*table_);
        ASSERT_TRUE(status.ok());
        ASSERT_EQ(rows.size(), 5u);
        EXPECT_EQ(rows.back(), generate_row(4));
    }

    TEST_F(FailureInjectionTest, CorruptedBytesReadBackVerbatim) {
        open_table();
        insert_rows(3);
        reopen_table();
        ASSERT_TRUE(table_->close().ok());
        table_.reset();

        // no checksums: a flipped id byte is simply a different id
        corrupt_file_at_offset(file_offset_of(1) + core::ID_OFFSET, 0x80);
        open_table();

        auto [status, rows] = engine::execute_select(*table_);
        ASSERT_TRUE(status.ok());
        ASSERT_EQ(rows.size(), 3u);
        EXPECT_EQ(rows[1].id, 1u ^ 0x80u);
        EXPECT_EQ(rows[1].username_view(), generate_username(1));
    }

    TEST_F(FailureInjectionTest, InvalidUtf8IsDisplayedLossily) {
        open_table();
        ASSERT_TRUE(engine::execute_insert(*table_, storage::Row(1, "ok", "ok@x")).ok());
        ASSERT_TRUE(table_->close().ok());
        table_.reset();

        corrupt_file_at_offset(core::USERNAME_OFFSET, 0xFF ^ 'o');
        open_table();

        auto [status, rows] = engine::execute_select(*table_);
        ASSERT_TRUE(status.ok());
        ASSERT_EQ(rows.size(), 1u);
        EXPECT_EQ(rows[0].to_display(), "(1 \xEF\xBF\xBDk ok@x)");
    }

    TEST_F(FailureInjectionTest, FileBeyondCapacityIsClampedByPager) {
        // 101 full pages on disk: more rows than a table may hold
        {
            std::ofstream out(test_db_path_, std::ios::binary);
            std::vector<char> bytes((core::TABLE_MAX_PAGES + 1) * core::PAGE_SIZE, '\0');
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        }
        open_table();
        EXPECT_GT(table_->num_rows(), core::TABLE_MAX_ROWS);

        EXPECT_TRUE(engine::execute_insert(*table_, generate_row(1)).is_table_full());

        // scanning stops at the page ceiling with an out-of-range error
        auto [status, rows] = engine::execute_select(*table_);
        EXPECT_TRUE(status.is_out_of_range());
        EXPECT_EQ(rows.size(), core::TABLE_MAX_ROWS);
    }

    // ============================================================================
    // I/O FAILURES
    // ============================================================================

    TEST_F(FailureInjectionTest, OpenDirectoryFails) {
        auto [status, table] = storage::Table::open(fs::temp_directory_path().string());
        EXPECT_EQ(status.code(), core::StatusCode::IOError);
        EXPECT_EQ(table, nullptr);
    }

    TEST_F(FailureInjectionTest, FlushFailureIsReportedByClose) {
        // every write to /dev/full fails with ENOSPC
        if (!fs::exists("/dev/full")) {
            GTEST_SKIP() << "/dev/full not available";
        }
        auto [open_status, table] = storage::Table::open("/dev/full");
        ASSERT_TRUE(open_status.ok()) << open_status.to_string();
        ASSERT_TRUE(engine::execute_insert(*table, generate_row(1)).ok());

        auto status = table->close();
        EXPECT_EQ(status.code(), core::StatusCode::IOError);
        EXPECT_NE(status.message().find("flush of page 0"), std::string::npos);

        // the table is closed even though the flush failed
        EXPECT_TRUE(table->is_closed());
        EXPECT_TRUE(table->close().ok());
    }

    TEST_F(FailureInjectionTest, FailedTeardownInDestructorAborts) {
        if (!fs::exists("/dev/full")) {
            GTEST_SKIP() << "/dev/full not available";
        }
        EXPECT_DEATH(drop_unflushable_table(), "");
    }

} // namespace strata::test
