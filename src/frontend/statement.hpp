#pragma once

#include "core/status.hpp"
#include "storage/row.hpp"

#include <string_view>
#include <utility>

namespace strata::frontend {

    enum class StatementType { Insert, Select };

    struct Statement {
        StatementType type = StatementType::Select;
        storage::Row row; // meaningful for Insert only
    };

    /*
     * Parses one line of statement text:
     *   insert <id> <username> <email>
     *   select
     * Words are separated by whitespace. Rejections are InvalidArgument with a
     * message meant for the user.
     */
    [[nodiscard]] auto prepare_statement(std::string_view input) -> std::pair<core::Status, Statement>;

    enum class MetaCommand { Exit };

    // Lines starting with '.'; only ".exit" is known.
    [[nodiscard]] auto do_meta_command(std::string_view input)
        -> std::pair<core::Status, MetaCommand>;

} // namespace strata::frontend
