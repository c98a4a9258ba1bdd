#include "engine/executor.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <vector>

namespace strata::test {

    class ExecutorTest : public TableTestFixture {};

    TEST_F(ExecutorTest, InsertAppendsAndSelectReturnsInOrder) {
        open_table();
        ASSERT_TRUE(engine::execute_insert(*table_, storage::Row(1, "alice", "alice@x.com")).ok());
        ASSERT_TRUE(engine::execute_insert(*table_, storage::Row(2, "bob", "bob@x.com")).ok());
        EXPECT_EQ(table_->num_rows(), 2u);

        auto [status, rows] = engine::execute_select(*table_);
        ASSERT_TRUE(status.ok());
        ASSERT_EQ(rows.size(), 2u);
        EXPECT_EQ(rows[0].to_display(), "(1 alice alice@x.com)");
        EXPECT_EQ(rows[1].to_display(), "(2 bob bob@x.com)");
    }

    TEST_F(ExecutorTest, SelectOnEmptyTable) {
        open_table();
        auto [status, rows] = engine::execute_select(*table_);
        EXPECT_TRUE(status.ok());
        EXPECT_TRUE(rows.empty());
    }

    TEST_F(ExecutorTest, DuplicateIdsAreStoredAsGiven) {
        open_table();
        ASSERT_TRUE(engine::execute_insert(*table_, storage::Row(5, "a", "a@x")).ok());
        ASSERT_TRUE(engine::execute_insert(*table_, storage::Row(5, "b", "b@x")).ok());

        auto [status, rows] = engine::execute_select(*table_);
        ASSERT_TRUE(status.ok());
        ASSERT_EQ(rows.size(), 2u);
        EXPECT_EQ(rows[0].username_view(), "a");
        EXPECT_EQ(rows[1].username_view(), "b");
    }

    TEST_F(ExecutorTest, ScanVisitsRowsInInsertionOrder) {
        open_table();
        insert_rows(40, 100);

        std::vector<uint32_t> ids;
        auto status = engine::scan_rows(*table_, [&](const storage::Row &row) { ids.push_back(row.id); });
        ASSERT_TRUE(status.ok());
        ASSERT_EQ(ids.size(), 40u);
        for (size_t i = 0; i < ids.size(); ++i) {
            EXPECT_EQ(ids[i], 100 + i);
        }
    }

    TEST_F(ExecutorTest, TableFullAtCapacity) {
        open_table();
        insert_rows(core::TABLE_MAX_ROWS);
        ASSERT_EQ(table_->num_rows(), core::TABLE_MAX_ROWS);

        auto status = engine::execute_insert(*table_, generate_row(9999));
        EXPECT_TRUE(status.is_table_full());
        EXPECT_EQ(table_->num_rows(), core::TABLE_MAX_ROWS);

        // still readable after the rejection
        auto [select_status, rows] = engine::execute_select(*table_);
        ASSERT_TRUE(select_status.ok());
        ASSERT_EQ(rows.size(), core::TABLE_MAX_ROWS);
        EXPECT_EQ(rows.back(), generate_row(core::TABLE_MAX_ROWS - 1));
    }

    TEST_F(ExecutorTest, FullTablePersistsEveryPage) {
        open_table();
        insert_rows(core::TABLE_MAX_ROWS);
        reopen_table();

        EXPECT_EQ(file_size(), core::TABLE_MAX_PAGES * core::PAGE_SIZE);
        EXPECT_EQ(table_->num_rows(), file_size() / core::ROW_SIZE);
        EXPECT_TRUE(engine::execute_insert(*table_, generate_row(0)).is_table_full());
    }

    TEST_F(ExecutorTest, OperationsAfterCloseFail) {
        open_table();
        insert_rows(2);
        ASSERT_TRUE(table_->close().ok());

        EXPECT_FALSE(engine::execute_insert(*table_, generate_row(3)).ok());
        auto [status, rows] = engine::execute_select(*table_);
        EXPECT_FALSE(status.ok());
        EXPECT_TRUE(rows.empty());
    }

} // namespace strata::test
