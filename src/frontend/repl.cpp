#include "frontend/repl.hpp"
#include "engine/executor.hpp"
#include "frontend/statement.hpp"

#include <cctype>
#include <string>

namespace strata::frontend {

    auto trim(std::string_view text) -> std::string_view {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
            text.remove_prefix(1);
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            text.remove_suffix(1);
        return text;
    }

    auto Repl::run() -> core::Status {
        std::string line;
        while (true) {
            out_ << PROMPT << std::flush;
            if (!std::getline(in_, line)) {
                if (in_.eof()) {
                    // end of input behaves like .exit
                    out_ << '\n';
                    return core::Status::Ok();
                }
                return core::Status::IOError("Unable to read line");
            }

            if (handle_line(trim(line)) == LineOutcome::Exit) {
                return core::Status::Ok();
            }
        }
    }

    auto Repl::handle_line(std::string_view line) -> LineOutcome {
        if (line.starts_with('.')) {
            auto [status, command] = do_meta_command(line);
            if (!status.ok()) {
                out_ << status.message() << '\n';
                return LineOutcome::Continue;
            }
            return command == MetaCommand::Exit ? LineOutcome::Exit : LineOutcome::Continue;
        }

        run_statement(line);
        return LineOutcome::Continue;
    }

    void Repl::run_statement(std::string_view line) {
        auto [prepare_status, statement] = prepare_statement(line);
        if (!prepare_status.ok()) {
            out_ << prepare_status.message() << '\n';
            return;
        }

        core::Status status;
        switch (statement.type) {
        case StatementType::Insert:
            status = engine::execute_insert(table_, statement.row);
            break;
        case StatementType::Select:
            status = engine::scan_rows(table_, [this](const storage::Row &row) {
                out_ << row.to_display() << '\n';
            });
            break;
        }

        if (status.ok()) {
            out_ << "Executed.\n";
        } else if (status.is_table_full()) {
            out_ << "Table full.\n";
        } else {
            out_ << "Error: " << status.to_string() << '\n';
        }
    }

} // namespace strata::frontend
