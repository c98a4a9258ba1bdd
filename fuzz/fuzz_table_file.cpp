#include "engine/executor.hpp"
#include "frontend/statement.hpp"
#include "storage/table.hpp"
#include <cstddef>
#include <cstdint>
#include <fcntl.h>
#include <string_view>
#include <unistd.h>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size > 512 * 1024) {
        return 0;
    }

    // the same bytes double as statement text
    (void)strata::frontend::prepare_statement(
        std::string_view(reinterpret_cast<const char *>(data), size));

    const char *db_path = "/tmp/fuzz_strata_table.db";

    int fd = open(db_path, O_CREAT | O_WRONLY | O_TRUNC, 0600);
    if (fd < 0) {
        return 0;
    }

    ssize_t written = write(fd, data, size);
    close(fd);

    if (written != static_cast<ssize_t>(size)) {
        unlink(db_path);
        return 0;
    }

    {
        auto [status, table] = strata::storage::Table::open(db_path);
        if (status.ok()) {
            auto [select_status, rows] = strata::engine::execute_select(*table);
            for (const auto &row : rows) {
                (void)row.to_display();
            }
            (void)strata::engine::execute_insert(*table, strata::storage::Row(1, "fuzz", "f@z"));
            (void)table->close();
        }
    }

    unlink(db_path);
    return 0;
}
