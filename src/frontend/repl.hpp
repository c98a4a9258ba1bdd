#pragma once

#include "core/status.hpp"
#include "storage/table.hpp"

#include <istream>
#include <ostream>
#include <string_view>

namespace strata::frontend {

    enum class LineOutcome { Continue, Exit };

    class Repl {
      public:
        Repl(storage::Table &table, std::istream &in, std::ostream &out)
            : table_(table), in_(in), out_(out) {}

        // Prompts and reads lines until ".exit" or end of input. Errors from
        // individual statements are printed, not returned.
        auto run() -> core::Status;

        auto handle_line(std::string_view line) -> LineOutcome;

        static constexpr std::string_view PROMPT = "db> ";

      private:
        void run_statement(std::string_view line);

        storage::Table &table_;
        std::istream &in_;
        std::ostream &out_;
    };

    // Leading and trailing whitespace removed
    auto trim(std::string_view text) -> std::string_view;

} // namespace strata::frontend
